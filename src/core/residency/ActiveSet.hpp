#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/engine/TransferEngine.hpp"

namespace bitserve {

class CatalogStore;

// Bounded working set of engine handles. Victims are chosen by the catalog's
// durable last_access ordering, so the policy survives restarts.
//
// One mutex guards the map; check-size-then-admit runs entirely under it, so
// two admits can never both see free room.
class ActiveSet {
public:
  ActiveSet(TransferEngine& engine, CatalogStore& catalog, std::size_t capacity);
  ~ActiveSet();

  ActiveSet(const ActiveSet&) = delete;
  ActiveSet& operator=(const ActiveSet&) = delete;

  // Makes room (evicting LRU residents) and inserts the handle, then marks the
  // row active. On failure the incoming handle is unloaded before rethrowing.
  // Returns the ids evicted to make room.
  std::vector<std::string> admit(const std::string& id, std::unique_ptr<EngineHandle> handle);

  // Flush stats, unload (payload kept), mark inactive. False if not resident.
  bool evict(const std::string& id);

  // Unload for removal. The catalog row is left to the caller.
  bool release(const std::string& id, bool deleteFiles);

  bool touch(const std::string& id);

  // Evicts from the LRU end until size <= capacity. Idempotent.
  std::vector<std::string> enforceCapacity();

  // Live status with counters made cumulative against the flushed baseline.
  std::optional<StatusSnapshot> snapshot(const std::string& id) const;

  // Writes every resident item's counters to the catalog. Engine read errors
  // are logged and that item skipped. Returns the number flushed.
  std::size_t flushStats();

  bool contains(const std::string& id) const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::vector<std::string> ids() const;

private:
  struct Entry {
    std::unique_ptr<EngineHandle> handle;
    int64_t base_uploaded   = 0;
    int64_t base_downloaded = 0;
  };

  StatusSnapshot cumulative(const Entry& e) const;
  bool flushLocked(const std::string& id, const Entry& e);
  void evictLocked(std::map<std::string, Entry>::iterator it);
  std::map<std::string, Entry>::iterator pickVictimLocked();

  TransferEngine& engine_;
  CatalogStore& catalog_;
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace bitserve
