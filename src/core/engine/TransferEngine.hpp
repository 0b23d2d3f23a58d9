#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bitserve {

struct DescriptorInfo {
  std::string id;    // hex info hash
  std::string name;  // "Unknown name" when the descriptor carries none
};

struct StatusSnapshot {
  std::string name;
  double      progress_fraction = 0.0;   // 0..1
  int64_t     download_rate     = 0;     // bytes/s
  int64_t     upload_rate       = 0;     // bytes/s
  std::string state;
  int64_t     seed_time         = 0;     // seconds
  int         peer_count        = 0;
  int64_t     bytes_uploaded    = 0;
  int64_t     bytes_downloaded  = 0;
};

// Opaque engine-side registration of one item. Never persisted; the
// descriptor blob plus the id is what gets stored to rebuild it.
class EngineHandle {
public:
  virtual ~EngineHandle() = default;
};

// The external transfer engine. Implementations report failures as
// ValidationError (parse) or EngineError (everything else).
class TransferEngine {
public:
  virtual ~TransferEngine() = default;

  virtual void open() = 0;
  virtual void close() = 0;

  // Structural validation only, nothing is registered.
  virtual DescriptorInfo parse(std::string_view bytes) const = 0;

  // Registers the descriptor and starts the transfer. All payload writes stay
  // under destination, which must lie inside the engine's download root.
  virtual std::unique_ptr<EngineHandle> load(std::string_view bytes,
                                             const std::string& destination) = 0;

  virtual StatusSnapshot status(const EngineHandle& handle) const = 0;

  virtual void unload(EngineHandle& handle, bool deleteFiles) = 0;

  // Whole-session snapshot, opaque to callers.
  virtual std::string saveSession() = 0;
  virtual void restoreSession(std::string_view blob) = 0;
};

} // namespace bitserve
