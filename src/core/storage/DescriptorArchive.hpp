#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace bitserve {

// Content-addressed store of raw descriptor blobs: one file per item,
// <root>/<id>.torrent. Ids must be hex info hashes.
class DescriptorArchive {
public:
  explicit DescriptorArchive(std::string root);

  // Overwrite-safe: writes a temp file then renames it over the target.
  // Returns the full path of the stored blob.
  std::string put(const std::string& id, std::string_view bytes);

  std::optional<std::string> get(const std::string& id) const;

  bool contains(const std::string& id) const;

  // Best effort; failures are logged, never thrown.
  void remove(const std::string& id) noexcept;

  const std::string& root() const { return root_; }

private:
  std::string pathFor(const std::string& id) const;

  std::string root_;
};

} // namespace bitserve
