#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "TransferEngine.hpp"

namespace lt {
class session;
}

namespace bitserve {

// True when a file path taken from a descriptor is absolute or climbs out of
// the directory it is joined to.
bool escapesSavePath(const std::string& relativePath);

// TransferEngine backed by libtorrent-rasterbar. Every load must target a
// path inside download_root, and descriptors naming files outside their
// save path are refused.
class LibtorrentEngine : public TransferEngine {
public:
  struct Options {
    std::string download_root;
    std::string listen_interfaces = "0.0.0.0:6881";
  };

  explicit LibtorrentEngine(Options options);
  ~LibtorrentEngine() override;

  void open() override;
  void close() override;

  DescriptorInfo parse(std::string_view bytes) const override;
  std::unique_ptr<EngineHandle> load(std::string_view bytes,
                                     const std::string& destination) override;
  StatusSnapshot status(const EngineHandle& handle) const override;
  void unload(EngineHandle& handle, bool deleteFiles) override;

  std::string saveSession() override;
  void restoreSession(std::string_view blob) override;

private:
  lt::session& session() const;
  std::string confine(const std::string& destination) const;

  Options options_;
  mutable std::mutex mutex_;
  std::unique_ptr<lt::session> session_;
};

} // namespace bitserve
