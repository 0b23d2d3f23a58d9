#include "CatalogStore.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <sqlite3.h>

#include "core/Errors.hpp"

namespace bitserve {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prepare failed: " + err);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void bindText(sqlite3_stmt* st, int i, const std::string& v) {
  sqlite3_bind_text(st, i, v.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt* st, int i) {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, i));
  return p ? std::string(p) : std::string();
}

// Runs a write statement to completion; returns the number of rows changed.
int stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
  return sqlite3_changes(db);
}

ItemRecord readRow(sqlite3_stmt* st) {
  ItemRecord r;
  r.id               = columnText(st, 0);
  r.name             = columnText(st, 1);
  r.bytes_uploaded   = sqlite3_column_int64(st, 2);
  r.bytes_downloaded = sqlite3_column_int64(st, 3);
  r.last_access      = sqlite3_column_int64(st, 4);
  r.residency        = parseResidency(columnText(st, 5));
  r.added_at         = sqlite3_column_int64(st, 6);
  return r;
}

constexpr const char* kColumns =
  "id, name, bytes_uploaded, bytes_downloaded, last_access, residency, added_at";

int64_t nowMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* toString(Residency r) {
  return r == Residency::active ? "active" : "inactive";
}

Residency parseResidency(const std::string& s) {
  if (s == "active") return Residency::active;
  if (s == "inactive") return Residency::inactive;
  throw ConsistencyError("unknown residency value '" + s + "'");
}

CatalogStore::CatalogStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + err);
  }
  db_ = db;

  try {
    sqlite3_busy_timeout(db, 5000);
    auto sync = prepare(db, "PRAGMA synchronous=NORMAL");
    stepDone(db, sync.get(), "PRAGMA synchronous");

    // Resume the access clock where the previous process left it.
    auto st = prepare(db, "SELECT COALESCE(MAX(last_access), 0) FROM items");
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
      throw std::runtime_error("reading access clock failed: " + std::string(sqlite3_errmsg(db)));
    }
    lastStamp_ = sqlite3_column_int64(st.get(), 0);
  } catch (...) {
    sqlite3_close_v2(db);
    throw;
  }
}

CatalogStore::~CatalogStore() {
  sqlite3_close_v2(static_cast<sqlite3*>(db_));
}

int64_t CatalogStore::nextAccessStamp() {
  std::lock_guard<std::mutex> lk(clockMutex_);
  lastStamp_ = std::max(nowMillis(), lastStamp_ + 1);
  return lastStamp_;
}

void CatalogStore::insert(const std::string& id, const std::string& name) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO items
      (id, name, bytes_uploaded, bytes_downloaded, last_access, residency, added_at)
    VALUES (?,?,0,0,?,'active',?)
  )SQL";
  auto st = prepare(db, sql);
  const int64_t stamp = nextAccessStamp();
  bindText(st.get(), 1, id);
  bindText(st.get(), 2, name);
  sqlite3_bind_int64(st.get(), 3, stamp);
  sqlite3_bind_int64(st.get(), 4, stamp);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) {
    throw ConflictError("item " + id + " already exists");
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("insert failed: " + std::string(sqlite3_errmsg(db)));
  }
}

bool CatalogStore::updateStats(const std::string& id, int64_t uploaded, int64_t downloaded) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    UPDATE items
       SET bytes_uploaded   = MAX(bytes_uploaded, ?),
           bytes_downloaded = MAX(bytes_downloaded, ?)
     WHERE id = ?
  )SQL");
  sqlite3_bind_int64(st.get(), 1, uploaded);
  sqlite3_bind_int64(st.get(), 2, downloaded);
  bindText(st.get(), 3, id);
  return stepDone(db, st.get(), "updateStats") > 0;
}

bool CatalogStore::updateResidency(const std::string& id, Residency residency) {
  auto* db = static_cast<sqlite3*>(db_);
  if (residency == Residency::active) {
    auto st = prepare(db, "UPDATE items SET residency = 'active', last_access = ? WHERE id = ?");
    sqlite3_bind_int64(st.get(), 1, nextAccessStamp());
    bindText(st.get(), 2, id);
    return stepDone(db, st.get(), "updateResidency") > 0;
  }
  auto st = prepare(db, "UPDATE items SET residency = 'inactive' WHERE id = ?");
  bindText(st.get(), 1, id);
  return stepDone(db, st.get(), "updateResidency") > 0;
}

bool CatalogStore::touch(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "UPDATE items SET last_access = ? WHERE id = ?");
  sqlite3_bind_int64(st.get(), 1, nextAccessStamp());
  bindText(st.get(), 2, id);
  return stepDone(db, st.get(), "touch") > 0;
}

std::optional<ItemRecord> CatalogStore::get(const std::string& id) const {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns + " FROM items WHERE id = ?";
  auto st = prepare(db, sql.c_str());
  bindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return readRow(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error("get failed: " + std::string(sqlite3_errmsg(db)));
  return std::nullopt;
}

std::vector<ItemRecord> CatalogStore::list(int64_t offset, int64_t limit) const {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns +
                          " FROM items ORDER BY rowid LIMIT ? OFFSET ?";
  auto st = prepare(db, sql.c_str());
  // negative LIMIT means "no limit" to SQLite
  sqlite3_bind_int64(st.get(), 1, limit < 0 ? -1 : limit);
  sqlite3_bind_int64(st.get(), 2, std::max<int64_t>(offset, 0));

  std::vector<ItemRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(readRow(st.get()));
  if (rc != SQLITE_DONE) throw std::runtime_error("list failed: " + std::string(sqlite3_errmsg(db)));
  return out;
}

std::set<std::string> CatalogStore::listIdsByResidency(Residency residency) const {
  auto ordered = idsByAccessOrder(residency);
  return std::set<std::string>(ordered.begin(), ordered.end());
}

std::vector<std::string> CatalogStore::idsByAccessOrder(Residency residency) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "SELECT id FROM items WHERE residency = ? ORDER BY last_access, rowid");
  sqlite3_bind_text(st.get(), 1, toString(residency), -1, SQLITE_STATIC);

  std::vector<std::string> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(columnText(st.get(), 0));
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("idsByAccessOrder failed: " + std::string(sqlite3_errmsg(db)));
  }
  return out;
}

bool CatalogStore::remove(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "DELETE FROM items WHERE id = ?");
  bindText(st.get(), 1, id);
  return stepDone(db, st.get(), "remove") > 0;
}

int64_t CatalogStore::count() const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "SELECT COUNT(*) FROM items");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error("count failed: " + std::string(sqlite3_errmsg(db)));
  }
  return sqlite3_column_int64(st.get(), 0);
}

} // namespace bitserve
