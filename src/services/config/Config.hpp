#pragma once
#include <cstdint>
#include <string>

namespace bitserve {

// Process configuration, read once from BITSERVE_* environment variables.
struct Config {
  std::string home;
  std::string db_path;
  std::string schema_path;        // empty: search the usual locations
  std::string archive_dir;
  std::string session_path;
  std::string download_root;
  std::string listen_interfaces;
  std::string api_key;            // empty = auth disabled
  std::string log_level;
  int64_t     max_active = 8;
  int         port = 8000;
  int64_t     flush_interval_sec = 0;
};

std::string get_env_or(const char* key, const std::string& defval);

// Throws std::runtime_error on malformed numeric values or capacity < 1.
Config loadConfig();

} // namespace bitserve
