#include "Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace bitserve {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int64_t env_int_or(const char* key, int64_t defval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  std::size_t used = 0;
  int64_t v = 0;
  try {
    v = std::stoll(raw, &used);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string(key) + " is not a number: '" + raw + "'");
  }
  if (used != raw.size()) {
    throw std::runtime_error(std::string(key) + " is not a number: '" + raw + "'");
  }
  return v;
}

Config loadConfig() {
  namespace fs = std::filesystem;
  Config c;
  c.home              = get_env_or("BITSERVE_HOME", "./.bitserve");
  c.db_path           = get_env_or("BITSERVE_DB_PATH", (fs::path(c.home) / "catalog.db").string());
  c.schema_path       = get_env_or("BITSERVE_SCHEMA_PATH", "");
  c.archive_dir       = get_env_or("BITSERVE_ARCHIVE_DIR", (fs::path(c.home) / "torrent_files").string());
  c.session_path      = get_env_or("BITSERVE_SESSION_PATH", (fs::path(c.home) / "session_state.dat").string());
  c.download_root     = get_env_or("BITSERVE_DOWNLOAD_ROOT", "./downloads");
  c.listen_interfaces = get_env_or("BITSERVE_LISTEN_INTERFACES", "0.0.0.0:6881");
  c.api_key           = get_env_or("BITSERVE_API_KEY", "");
  c.log_level         = get_env_or("BITSERVE_LOG_LEVEL", "info");

  c.max_active = env_int_or("BITSERVE_MAX_ACTIVE", 8);
  if (c.max_active < 1) throw std::runtime_error("BITSERVE_MAX_ACTIVE must be at least 1");

  const int64_t port = env_int_or("BITSERVE_PORT", 8000);
  if (port < 1 || port > 65535) throw std::runtime_error("BITSERVE_PORT out of range");
  c.port = static_cast<int>(port);

  c.flush_interval_sec = env_int_or("BITSERVE_FLUSH_INTERVAL_SEC", 0);
  if (c.flush_interval_sec < 0) throw std::runtime_error("BITSERVE_FLUSH_INTERVAL_SEC must be >= 0");
  return c;
}

} // namespace bitserve
