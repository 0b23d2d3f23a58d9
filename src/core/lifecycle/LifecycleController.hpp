#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/catalog/CatalogStore.hpp"
#include "core/engine/TransferEngine.hpp"
#include "core/lifecycle/KeyedMutex.hpp"
#include "core/residency/ActiveSet.hpp"

namespace bitserve {

class DescriptorArchive;
class EventQueue;
enum class EventType;

struct LifecycleOptions {
  std::size_t max_active = 8;
  std::string download_root;
  std::string session_path;   // empty: session blob not persisted
};

// Catalog row merged with live engine status (resident items) or the last
// flushed counters with zeroed rates (inactive items).
struct ItemView {
  ItemRecord     record;
  StatusSnapshot status;
  bool           resident = false;
};

struct Upload {
  std::string filename;
  std::string bytes;
};

struct AddBatchResult {
  struct Success { std::string filename; std::string id; };
  struct Failure { std::string filename; std::string reason; };
  std::vector<Success> success;
  std::vector<Failure> errors;
};

struct RemoveBatchResult {
  std::vector<std::string> removed;
  std::vector<std::string> not_found;
  struct Failure { std::string id; std::string reason; };
  std::vector<Failure> errors;
};

struct ReconcileReport {
  std::vector<std::string> resumed;
  std::vector<std::string> warnings;
};

// Orchestrates add / pause / resume / remove across catalog, archive and the
// active set. Operations on one id are serialized; different ids proceed in
// parallel except for the active set's own admission lock.
class LifecycleController {
public:
  LifecycleController(CatalogStore& catalog,
                      DescriptorArchive& archive,
                      TransferEngine& engine,
                      EventQueue& events,
                      LifecycleOptions options);

  // Startup: restore the session blob, then reload every row marked active.
  ReconcileReport open();
  // Shutdown: flush stats, then persist the session blob.
  void close();

  // Returns the new item's id. Throws ValidationError, ConflictError, EngineError.
  std::string add(std::string_view descriptor);

  // Throws NotFoundError for unknown ids.
  void remove(const std::string& id, bool deleteFiles);

  // False when the item was already inactive. Throws NotFoundError.
  bool pause(const std::string& id);

  // Throws NotFoundError (unknown id or missing descriptor), EngineError.
  void resume(const std::string& id);

  std::vector<ItemView> list(int64_t offset, int64_t limit) const;

  std::size_t flushStats();

  ReconcileReport reconcile();

  AddBatchResult addItems(const std::vector<Upload>& uploads);
  RemoveBatchResult removeItems(const std::vector<std::string>& ids, bool deleteFiles);

  // Inconsistencies detected by the last reconciliation that no later
  // remove, pause or resume of the same id has resolved.
  std::vector<std::string> consistencyWarnings() const;

  const ActiveSet& activeSet() const { return active_; }

private:
  void publish(EventType type, const std::string& id, const std::string& name);
  void publishEvictions(const std::vector<std::string>& ids);
  void restoreSession();
  void saveSession();
  void clearWarning(const std::string& id);

  CatalogStore& catalog_;
  DescriptorArchive& archive_;
  TransferEngine& engine_;
  EventQueue& events_;
  LifecycleOptions options_;

  ActiveSet active_;
  KeyedMutex locks_;

  mutable std::mutex warningsMutex_;
  std::map<std::string, std::string> warnings_;   // id -> message
};

} // namespace bitserve
