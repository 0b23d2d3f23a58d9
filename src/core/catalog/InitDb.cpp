#include "InitDb.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace bitserve {

namespace {

using DbPtr = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

const char* const kItemColumns[] = {
  "id", "name", "bytes_uploaded", "bytes_downloaded", "last_access", "residency", "added_at",
};

void exec(sqlite3* db, const std::string& sql, const char* what) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error(std::string(what) + " failed: " + msg);
  }
}

StmtPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prepare failed: " + err);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

int userVersion(sqlite3* db) {
  auto st = prepare(db, "PRAGMA user_version");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("reading user_version failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int(st.get(), 0);
}

std::set<std::string> itemColumns(sqlite3* db) {
  std::set<std::string> out;
  auto st = prepare(db, "PRAGMA table_info(items)");
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 1));
    if (p) out.insert(p);
  }
  return out;
}

// An existing items table must carry every column the store reads.
void checkItemColumns(sqlite3* db, const std::string& dbPath) {
  const auto columns = itemColumns(db);
  for (const char* c : kItemColumns) {
    if (!columns.count(c)) {
      throw ConsistencyError("catalog " + dbPath + ": table items has no column " + c);
    }
  }
}

std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("cannot open schema file " + schemaPath);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

int initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  const std::string schema = readSchema(schemaPath);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbPtr db(raw, &sqlite3_close);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("cannot open catalog " + dbPath + ": " +
                             (raw ? sqlite3_errmsg(raw) : "out of memory"));
  }

  const int found = userVersion(db.get());
  if (found != 0 && found != kCatalogSchemaVersion) {
    throw ConsistencyError("catalog " + dbPath + " has schema version " + std::to_string(found) +
                           ", expected " + std::to_string(kCatalogSchemaVersion));
  }

  // WAL is a property of the file; busy_timeout only matters for this connection
  exec(db.get(), "PRAGMA journal_mode=WAL", "enabling WAL");
  exec(db.get(), "PRAGMA busy_timeout=5000", "setting busy_timeout");

  exec(db.get(), "BEGIN IMMEDIATE", "begin");
  try {
    if (!itemColumns(db.get()).empty()) checkItemColumns(db.get(), dbPath);
    exec(db.get(), schema, "applying schema");
    checkItemColumns(db.get(), dbPath);
    exec(db.get(), "PRAGMA user_version=" + std::to_string(kCatalogSchemaVersion),
         "stamping schema version");
    exec(db.get(), "COMMIT", "commit");
  } catch (const std::exception&) {
    sqlite3_exec(db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }

  if (found == 0) {
    spdlog::info("catalog {} initialised at schema version {}", dbPath, kCatalogSchemaVersion);
  }
  return kCatalogSchemaVersion;
}

} // namespace bitserve
