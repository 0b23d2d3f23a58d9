#include "LifecycleController.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/lifecycle/EventQueue.hpp"
#include "core/storage/DescriptorArchive.hpp"

namespace bitserve {

namespace fs = std::filesystem;

LifecycleController::LifecycleController(CatalogStore& catalog,
                                         DescriptorArchive& archive,
                                         TransferEngine& engine,
                                         EventQueue& events,
                                         LifecycleOptions options)
  : catalog_(catalog),
    archive_(archive),
    engine_(engine),
    events_(events),
    options_(std::move(options)),
    active_(engine, catalog, options_.max_active) {
  fs::create_directories(options_.download_root);
}

void LifecycleController::publish(EventType type, const std::string& id, const std::string& name) {
  events_.publish(LifecycleEvent{type, id, name, static_cast<int64_t>(std::time(nullptr))});
}

void LifecycleController::publishEvictions(const std::vector<std::string>& ids) {
  for (const auto& id : ids) {
    auto rec = catalog_.get(id);
    publish(EventType::evicted, id, rec ? rec->name : std::string());
  }
}

// ---------- startup / shutdown ----------

void LifecycleController::restoreSession() {
  if (options_.session_path.empty() || !fs::exists(options_.session_path)) return;
  std::ifstream in(options_.session_path, std::ios::binary);
  if (!in) {
    spdlog::warn("cannot read session state {}", options_.session_path);
    return;
  }
  std::string blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  try {
    engine_.restoreSession(blob);
    spdlog::info("session state restored from {}", options_.session_path);
  } catch (const EngineError& e) {
    spdlog::warn("session state {} not restored: {}", options_.session_path, e.what());
  }
}

void LifecycleController::saveSession() {
  if (options_.session_path.empty()) return;
  const std::string blob = engine_.saveSession();
  const fs::path target(options_.session_path);
  if (target.has_parent_path()) fs::create_directories(target.parent_path());
  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
    os.write(blob.data(), static_cast<std::streamsize>(blob.size()));
    os.flush();
    if (!os) throw std::runtime_error("short write to " + tmp.string());
  }
  fs::rename(tmp, target);
  spdlog::info("session state saved to {}", target.string());
}

ReconcileReport LifecycleController::open() {
  restoreSession();
  return reconcile();
}

void LifecycleController::close() {
  const std::size_t flushed = flushStats();
  spdlog::info("flushed stats for {} resident item(s)", flushed);
  saveSession();
}

ReconcileReport LifecycleController::reconcile() {
  ReconcileReport report;
  std::map<std::string, std::string> warnings;
  std::vector<std::string> evicted;

  // Oldest first: if more rows claim active than fit, the most recently used
  // ones are the ones left resident.
  for (const auto& id : catalog_.idsByAccessOrder(Residency::active)) {
    auto guard = locks_.lock(id);
    if (active_.contains(id)) continue;

    auto bytes = archive_.get(id);
    if (!bytes) {
      const ConsistencyError err("item " + id + " is marked active but its descriptor is missing");
      spdlog::warn("{}", err.what());
      warnings[id] = err.what();
      continue;
    }
    try {
      auto handle = engine_.load(*bytes, options_.download_root);
      auto out = active_.admit(id, std::move(handle));
      evicted.insert(evicted.end(), out.begin(), out.end());
      report.resumed.push_back(id);
    } catch (const EngineError& e) {
      const ConsistencyError err("item " + id + " is marked active but could not be loaded: " +
                                 e.what());
      spdlog::warn("{}", err.what());
      warnings[id] = err.what();
    }
  }
  auto more = active_.enforceCapacity();
  evicted.insert(evicted.end(), more.begin(), more.end());

  for (const auto& w : warnings) report.warnings.push_back(w.second);

  spdlog::info("reconciled {} active item(s), {} warning(s)",
               report.resumed.size(), report.warnings.size());
  {
    std::lock_guard<std::mutex> lk(warningsMutex_);
    warnings_ = std::move(warnings);
  }
  publishEvictions(evicted);
  return report;
}

std::vector<std::string> LifecycleController::consistencyWarnings() const {
  std::lock_guard<std::mutex> lk(warningsMutex_);
  std::vector<std::string> out;
  out.reserve(warnings_.size());
  for (const auto& w : warnings_) out.push_back(w.second);
  return out;
}

void LifecycleController::clearWarning(const std::string& id) {
  std::lock_guard<std::mutex> lk(warningsMutex_);
  if (warnings_.erase(id)) spdlog::info("consistency warning for {} resolved", id);
}

// ---------- operations ----------

std::string LifecycleController::add(std::string_view descriptor) {
  const DescriptorInfo info = engine_.parse(descriptor);
  auto guard = locks_.lock(info.id);

  if (catalog_.get(info.id)) throw ConflictError("Torrent already added.");

  // Descriptor before row, so a row never exists without its blob.
  archive_.put(info.id, descriptor);
  try {
    catalog_.insert(info.id, info.name);
  } catch (...) {
    archive_.remove(info.id);
    throw;
  }

  std::vector<std::string> evicted;
  try {
    auto handle = engine_.load(descriptor, options_.download_root);
    evicted = active_.admit(info.id, std::move(handle));
  } catch (const std::exception& e) {
    spdlog::error("loading {} failed, rolling back: {}", info.id, e.what());
    catalog_.remove(info.id);
    archive_.remove(info.id);
    throw;
  }
  auto more = active_.enforceCapacity();
  evicted.insert(evicted.end(), more.begin(), more.end());

  spdlog::info("added {} ({})", info.id, info.name);
  publish(EventType::added, info.id, info.name);
  publishEvictions(evicted);
  return info.id;
}

void LifecycleController::remove(const std::string& id, bool deleteFiles) {
  auto guard = locks_.lock(id);
  auto rec = catalog_.get(id);
  if (!rec) throw NotFoundError("item " + id + " not found");

  active_.release(id, deleteFiles);
  archive_.remove(id);
  catalog_.remove(id);
  clearWarning(id);

  spdlog::info("removed {} (delete files: {})", id, deleteFiles);
  publish(EventType::removed, id, rec->name);
}

bool LifecycleController::pause(const std::string& id) {
  auto guard = locks_.lock(id);
  auto rec = catalog_.get(id);
  if (!rec) throw NotFoundError("item " + id + " not found");

  if (!active_.evict(id)) {
    if (rec->residency == Residency::inactive) return false;
    // Row claimed residency without a handle (see reconcile); the user's
    // intent is now explicit, so record it.
    catalog_.updateResidency(id, Residency::inactive);
    clearWarning(id);
  }
  spdlog::info("paused {}", id);
  publish(EventType::paused, id, rec->name);
  return true;
}

void LifecycleController::resume(const std::string& id) {
  auto guard = locks_.lock(id);
  auto rec = catalog_.get(id);
  if (!rec) throw NotFoundError("item " + id + " not found");

  if (active_.touch(id)) return;

  auto bytes = archive_.get(id);
  if (!bytes) {
    throw NotFoundError("descriptor for " + id + " is missing from the archive");
  }
  auto handle = engine_.load(*bytes, options_.download_root);
  auto evicted = active_.admit(id, std::move(handle));
  auto more = active_.enforceCapacity();
  evicted.insert(evicted.end(), more.begin(), more.end());
  clearWarning(id);

  spdlog::info("resumed {}", id);
  publish(EventType::resumed, id, rec->name);
  publishEvictions(evicted);
}

std::vector<ItemView> LifecycleController::list(int64_t offset, int64_t limit) const {
  std::vector<ItemView> out;
  for (auto& rec : catalog_.list(offset, limit)) {
    ItemView v;
    v.status.name = rec.name;
    v.status.bytes_uploaded = rec.bytes_uploaded;
    v.status.bytes_downloaded = rec.bytes_downloaded;
    // an "active" row without a handle was left behind by reconciliation
    v.status.state = rec.residency == Residency::inactive ? "inactive" : "unavailable";
    try {
      if (auto live = active_.snapshot(rec.id)) {
        v.status = std::move(*live);
        if (v.status.name.empty()) v.status.name = rec.name;
        v.resident = true;
      }
    } catch (const EngineError& e) {
      spdlog::warn("status read failed for {}: {}", rec.id, e.what());
      v.status.state = "error";
    }
    v.record = std::move(rec);
    out.push_back(std::move(v));
  }
  return out;
}

std::size_t LifecycleController::flushStats() {
  return active_.flushStats();
}

// ---------- batches ----------

AddBatchResult LifecycleController::addItems(const std::vector<Upload>& uploads) {
  AddBatchResult result;
  for (const auto& u : uploads) {
    try {
      result.success.push_back({u.filename, add(u.bytes)});
    } catch (const Error& e) {
      result.errors.push_back({u.filename, e.what()});
    } catch (const std::exception& e) {
      spdlog::error("adding {} failed: {}", u.filename, e.what());
      result.errors.push_back({u.filename, e.what()});
    }
  }
  return result;
}

RemoveBatchResult LifecycleController::removeItems(const std::vector<std::string>& ids,
                                                   bool deleteFiles) {
  RemoveBatchResult result;
  for (const auto& id : ids) {
    try {
      remove(id, deleteFiles);
      result.removed.push_back(id);
    } catch (const NotFoundError&) {
      result.not_found.push_back(id);
    } catch (const std::exception& e) {
      spdlog::error("removing {} failed: {}", id, e.what());
      result.errors.push_back({id, e.what()});
    }
  }
  return result;
}

} // namespace bitserve
