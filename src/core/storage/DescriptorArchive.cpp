#include "DescriptorArchive.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace bitserve {

namespace fs = std::filesystem;

static bool isHexId(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

DescriptorArchive::DescriptorArchive(std::string root) : root_(std::move(root)) {
  fs::create_directories(root_);
}

std::string DescriptorArchive::pathFor(const std::string& id) const {
  if (!isHexId(id)) throw ValidationError("invalid descriptor id '" + id + "'");
  return (fs::path(root_) / (id + ".torrent")).string();
}

std::string DescriptorArchive::put(const std::string& id, std::string_view bytes) {
  const fs::path file = pathFor(id);
  const fs::path tmp = file.string() + ".tmp";
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw std::runtime_error("short write to " + tmp.string());
  }
  fs::rename(tmp, file);
  return fs::weakly_canonical(file).string();
}

std::optional<std::string> DescriptorArchive::get(const std::string& id) const {
  std::ifstream in(pathFor(id), std::ios::binary);
  if (!in) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool DescriptorArchive::contains(const std::string& id) const {
  std::error_code ec;
  return fs::exists(pathFor(id), ec);
}

void DescriptorArchive::remove(const std::string& id) noexcept {
  try {
    std::error_code ec;
    const std::string file = pathFor(id);
    if (!fs::remove(file, ec) && ec) {
      spdlog::warn("failed to delete descriptor {}: {}", file, ec.message());
    }
  } catch (const std::exception& e) {
    spdlog::warn("failed to delete descriptor for {}: {}", id, e.what());
  }
}

} // namespace bitserve
