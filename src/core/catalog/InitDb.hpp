#pragma once
#include <string>

namespace bitserve {

// Version stamped into PRAGMA user_version by initDatabase.
constexpr int kCatalogSchemaVersion = 1;

// Creates the catalog file if needed and applies schema.sql to it.
// A database already stamped with another schema version is refused with
// ConsistencyError and left untouched, as is one whose `items` table lacks a
// column the store reads. Returns the version the database ends up at.
int initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace bitserve
