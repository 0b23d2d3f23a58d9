#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bitserve {

enum class Residency { active, inactive };

const char* toString(Residency r);
// Throws ConsistencyError on anything but "active" / "inactive".
Residency parseResidency(const std::string& s);

struct ItemRecord {
  std::string id;
  std::string name;
  int64_t     bytes_uploaded   = 0;
  int64_t     bytes_downloaded = 0;
  int64_t     last_access      = 0;   // ms since epoch, strictly increasing per store
  Residency   residency        = Residency::inactive;
  int64_t     added_at         = 0;
};

// Durable record of every known item, keyed by info hash. Each call is its own
// single-row transaction; the connection is opened in serialized mode so one
// store may be shared between threads.
class CatalogStore {
public:
  explicit CatalogStore(const std::string& dbPath);
  ~CatalogStore();

  CatalogStore(const CatalogStore&) = delete;
  CatalogStore& operator=(const CatalogStore&) = delete;

  // New row with zero counters, residency=active, last_access=now.
  // Throws ConflictError if the id is already present.
  void insert(const std::string& id, const std::string& name);

  // Counters only move forward. Returns false (and does nothing) when the row
  // is gone, which is expected when a flush races a removal.
  bool updateStats(const std::string& id, int64_t uploaded, int64_t downloaded);

  // Transition to active also refreshes last_access. Returns false if absent.
  bool updateResidency(const std::string& id, Residency residency);

  // Refresh last_access without changing residency.
  bool touch(const std::string& id);

  std::optional<ItemRecord> get(const std::string& id) const;

  // Insertion (rowid) order.
  std::vector<ItemRecord> list(int64_t offset, int64_t limit) const;

  std::set<std::string> listIdsByResidency(Residency residency) const;

  // Oldest last_access first, ties broken by rowid. This is the eviction order.
  std::vector<std::string> idsByAccessOrder(Residency residency) const;

  bool remove(const std::string& id);

  int64_t count() const;

private:
  int64_t nextAccessStamp();

  void* db_; // sqlite3*
  std::mutex clockMutex_;
  int64_t lastStamp_ = 0;
};

} // namespace bitserve
