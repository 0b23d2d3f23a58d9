#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/catalog/InitDb.hpp"
#include "core/catalog/CatalogStore.hpp"
#include "core/engine/TransferEngine.hpp"
#include "core/lifecycle/EventQueue.hpp"
#include "core/lifecycle/LifecycleController.hpp"
#include "core/storage/DescriptorArchive.hpp"

namespace bitserve::test {

// Descriptor understood by FakeEngine: "fake:<hex id>:<name>".
inline std::string descriptor(const std::string& id, const std::string& name = "") {
  return "fake:" + id + ":" + name;
}

class FakeHandle : public EngineHandle {
public:
  FakeHandle(std::string id, std::string name, std::string destination)
    : id(std::move(id)), name(std::move(name)), destination(std::move(destination)) {}
  std::string id;
  std::string name;
  std::string destination;
};

// Deterministic in-memory engine with failure injection.
class FakeEngine : public TransferEngine {
public:
  void open() override { opened = true; }
  void close() override { opened = false; }

  DescriptorInfo parse(std::string_view bytes) const override {
    const std::string s(bytes);
    if (s.rfind("fake:", 0) != 0) throw ValidationError("not a descriptor");
    const auto sep = s.find(':', 5);
    if (sep == std::string::npos || sep == 5) throw ValidationError("descriptor has no id");
    DescriptorInfo info;
    info.id = s.substr(5, sep - 5);
    info.name = s.substr(sep + 1);
    if (info.name.empty()) info.name = "Unknown name";
    return info;
  }

  std::unique_ptr<EngineHandle> load(std::string_view bytes,
                                     const std::string& destination) override {
    DescriptorInfo info;
    try {
      info = parse(bytes);
    } catch (const ValidationError& e) {
      throw EngineError(e.what());
    }
    std::lock_guard<std::mutex> lk(mtx);
    if (failLoad.count(info.id)) throw EngineError("injected load failure for " + info.id);
    if (loaded.count(info.id)) throw EngineError("already in session: " + info.id);
    loaded.insert(info.id);
    destinations.push_back(destination);
    ++loadCalls;
    return std::make_unique<FakeHandle>(info.id, info.name, destination);
  }

  StatusSnapshot status(const EngineHandle& handle) const override {
    const auto& h = dynamic_cast<const FakeHandle&>(handle);
    std::lock_guard<std::mutex> lk(mtx);
    if (failStatus.count(h.id)) throw EngineError("injected status failure for " + h.id);
    StatusSnapshot s;
    s.name = h.name;
    s.state = "downloading";
    s.progress_fraction = 0.5;
    s.download_rate = 2000;
    s.upload_rate = 1000;
    s.peer_count = 3;
    auto it = counters.find(h.id);
    if (it != counters.end()) {
      s.bytes_uploaded = it->second.first;
      s.bytes_downloaded = it->second.second;
    }
    return s;
  }

  void unload(EngineHandle& handle, bool deleteFiles) override {
    const auto& h = dynamic_cast<const FakeHandle&>(handle);
    std::lock_guard<std::mutex> lk(mtx);
    if (failUnload.count(h.id)) throw EngineError("injected unload failure for " + h.id);
    loaded.erase(h.id);
    counters.erase(h.id);
    unloads.push_back({h.id, deleteFiles});
  }

  std::string saveSession() override { return "session:" + std::to_string(loadCalls); }
  void restoreSession(std::string_view blob) override { restored = std::string(blob); }

  // Session counters the engine will report for a loaded id.
  void setCounters(const std::string& id, int64_t up, int64_t down) {
    std::lock_guard<std::mutex> lk(mtx);
    counters[id] = {up, down};
  }

  bool isLoaded(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx);
    return loaded.count(id) > 0;
  }

  mutable std::mutex mtx;
  bool opened = false;
  std::set<std::string> loaded;
  std::set<std::string> failLoad, failStatus, failUnload;
  std::map<std::string, std::pair<int64_t, int64_t>> counters;
  std::vector<std::pair<std::string, bool>> unloads;
  std::vector<std::string> destinations;
  std::string restored;
  int loadCalls = 0;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("bitserve_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  std::string operator/(const std::string& leaf) const { return (path_ / leaf).string(); }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::string freshCatalog(const TempDir& dir) {
  const std::string db = dir / "catalog.db";
  initDatabase(db, BITSERVE_SCHEMA_PATH);
  return db;
}

// Everything a LifecycleController needs, on disk under one temp dir.
// restart() drops the process-side state and builds it again from disk.
struct Harness {
  explicit Harness(std::size_t capacity) : capacity(capacity) { start(); }
  ~Harness() { events->stop(); }

  void start() {
    catalog = std::make_unique<CatalogStore>(dbPath);
    archive = std::make_unique<DescriptorArchive>(dir / "torrent_files");
    engine = std::make_unique<FakeEngine>();
    events = std::make_unique<EventQueue>();
    LifecycleOptions opts;
    opts.max_active = capacity;
    opts.download_root = dir / "downloads";
    opts.session_path = dir / "session_state.dat";
    lifecycle = std::make_unique<LifecycleController>(*catalog, *archive, *engine, *events, opts);
  }

  void restart() {
    lifecycle->close();
    events->stop();
    lifecycle.reset();
    events.reset();
    engine.reset();
    archive.reset();
    catalog.reset();
    start();
  }

  std::string add(const std::string& id, const std::string& name = "") {
    return lifecycle->add(descriptor(id, name));
  }

  bool resident(const std::string& id) const { return lifecycle->activeSet().contains(id); }

  // residency == active  <=>  handle in the active set
  ::testing::AssertionResult consistent() const {
    for (const auto& rec : catalog->list(0, -1)) {
      const bool claimsActive = rec.residency == Residency::active;
      if (claimsActive != resident(rec.id)) {
        return ::testing::AssertionFailure()
               << rec.id << " catalog=" << toString(rec.residency)
               << " resident=" << resident(rec.id);
      }
    }
    if (lifecycle->activeSet().size() > capacity) {
      return ::testing::AssertionFailure() << "active set over capacity";
    }
    return ::testing::AssertionSuccess();
  }

  std::size_t capacity;
  TempDir dir;
  std::string dbPath = freshCatalog(dir);
  std::unique_ptr<CatalogStore> catalog;
  std::unique_ptr<DescriptorArchive> archive;
  std::unique_ptr<FakeEngine> engine;
  std::unique_ptr<EventQueue> events;
  std::unique_ptr<LifecycleController> lifecycle;
};

} // namespace bitserve::test
