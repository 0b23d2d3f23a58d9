#include "ActiveSet.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/catalog/CatalogStore.hpp"

namespace bitserve {

ActiveSet::ActiveSet(TransferEngine& engine, CatalogStore& catalog, std::size_t capacity)
  : engine_(engine), catalog_(catalog), capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("active set capacity must be at least 1");
}

ActiveSet::~ActiveSet() = default;

StatusSnapshot ActiveSet::cumulative(const Entry& e) const {
  StatusSnapshot s = engine_.status(*e.handle);
  s.bytes_uploaded   += e.base_uploaded;
  s.bytes_downloaded += e.base_downloaded;
  return s;
}

bool ActiveSet::flushLocked(const std::string& id, const Entry& e) {
  StatusSnapshot s;
  try {
    s = cumulative(e);
  } catch (const EngineError& ex) {
    spdlog::warn("status read failed for {}, stats not flushed: {}", id, ex.what());
    return false;
  }
  if (!catalog_.updateStats(id, s.bytes_uploaded, s.bytes_downloaded)) {
    spdlog::debug("stats flush for {} found no catalog row", id);
  }
  return true;
}

std::map<std::string, ActiveSet::Entry>::iterator ActiveSet::pickVictimLocked() {
  for (const auto& id : catalog_.idsByAccessOrder(Residency::active)) {
    auto it = entries_.find(id);
    if (it != entries_.end()) return it;
  }
  // A resident handle whose row is not marked active: still evict it, the
  // capacity bound wins over ordering.
  spdlog::warn("no catalog ordering for {} resident item(s), evicting by id", entries_.size());
  return entries_.begin();
}

void ActiveSet::evictLocked(std::map<std::string, Entry>::iterator it) {
  const std::string id = it->first;
  flushLocked(id, it->second);
  engine_.unload(*it->second.handle, false);
  entries_.erase(it);
  const auto rec = catalog_.get(id);
  catalog_.updateResidency(id, Residency::inactive);
  spdlog::info("evicted {} (last_access {}) from active set ({}/{})",
               id, rec ? rec->last_access : 0, entries_.size(), capacity_);
}

std::vector<std::string> ActiveSet::admit(const std::string& id,
                                          std::unique_ptr<EngineHandle> handle) {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<std::string> evicted;
  try {
    if (entries_.count(id)) throw ConflictError("item " + id + " is already resident");

    while (entries_.size() >= capacity_) {
      auto victim = pickVictimLocked();
      evicted.push_back(victim->first);
      evictLocked(victim);
    }

    Entry e;
    if (auto rec = catalog_.get(id)) {
      e.base_uploaded   = rec->bytes_uploaded;
      e.base_downloaded = rec->bytes_downloaded;
    }
    e.handle = std::move(handle);
    entries_.emplace(id, std::move(e));
  } catch (const std::exception& ex) {
    if (handle) {
      try {
        engine_.unload(*handle, false);
      } catch (const EngineError& unloadErr) {
        spdlog::error("could not unload rejected handle for {}: {}", id, unloadErr.what());
      }
    }
    spdlog::error("admission of {} failed: {}", id, ex.what());
    throw;
  }

  // Engine already holds the item, so the row may now claim residency.
  try {
    catalog_.updateResidency(id, Residency::active);
  } catch (const std::exception& ex) {
    auto it = entries_.find(id);
    try {
      engine_.unload(*it->second.handle, false);
    } catch (const EngineError& unloadErr) {
      spdlog::error("could not unload {} after failed catalog write: {}", id, unloadErr.what());
    }
    entries_.erase(it);
    spdlog::error("marking {} active failed: {}", id, ex.what());
    throw;
  }
  spdlog::info("admitted {} ({}/{})", id, entries_.size(), capacity_);
  return evicted;
}

bool ActiveSet::evict(const std::string& id) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  evictLocked(it);
  return true;
}

bool ActiveSet::release(const std::string& id, bool deleteFiles) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  flushLocked(id, it->second);
  engine_.unload(*it->second.handle, deleteFiles);
  entries_.erase(it);
  return true;
}

bool ActiveSet::touch(const std::string& id) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (!entries_.count(id)) return false;
  return catalog_.touch(id);
}

std::vector<std::string> ActiveSet::enforceCapacity() {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<std::string> evicted;
  while (entries_.size() > capacity_) {
    auto victim = pickVictimLocked();
    evicted.push_back(victim->first);
    evictLocked(victim);
  }
  return evicted;
}

std::optional<StatusSnapshot> ActiveSet::snapshot(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return cumulative(it->second);
}

std::size_t ActiveSet::flushStats() {
  std::lock_guard<std::mutex> lk(mutex_);
  std::size_t flushed = 0;
  for (const auto& [id, e] : entries_) {
    try {
      if (flushLocked(id, e)) ++flushed;
    } catch (const std::exception& ex) {
      // one item's failed write must not cost the others theirs
      spdlog::error("stats flush for {} failed: {}", id, ex.what());
    }
  }
  return flushed;
}

bool ActiveSet::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mutex_);
  return entries_.count(id) > 0;
}

std::size_t ActiveSet::size() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return entries_.size();
}

std::vector<std::string> ActiveSet::ids() const {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.push_back(kv.first);
  return out;
}

} // namespace bitserve
