#pragma once
#include <stdexcept>
#include <string>

namespace bitserve {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed descriptor. Rejected per item, never aborts a batch.
struct ValidationError : Error {
  using Error::Error;
};

// Duplicate id; the existing item is left untouched.
struct ConflictError : Error {
  using Error::Error;
};

struct NotFoundError : Error {
  using Error::Error;
};

// load / unload / status failure reported by the transfer engine.
struct EngineError : Error {
  using Error::Error;
};

// Catalog and archive (or engine) disagree about an item.
struct ConsistencyError : Error {
  using Error::Error;
};

} // namespace bitserve
