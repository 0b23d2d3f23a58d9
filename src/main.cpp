// src/main.cpp
#include <csignal>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <pthread.h>
#include <spdlog/spdlog.h>

#include "core/catalog/CatalogStore.hpp"
#include "core/catalog/InitDb.hpp"
#include "core/engine/LibtorrentEngine.hpp"
#include "core/lifecycle/EventQueue.hpp"
#include "core/lifecycle/LifecycleController.hpp"
#include "core/storage/DescriptorArchive.hpp"
#include "services/api/HttpServer.hpp"
#include "services/config/Config.hpp"
#include "services/flush/StatsFlusher.hpp"
#include "services/webhooks/WebhookDispatcher.hpp"

using namespace bitserve;

// ---------- helpers ----------

// Explicit path first, then CWD (the build copies it there), then the source tree.
static std::string findSchemaPath(const Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schema_path.empty()) return cfg.schema_path;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/catalog/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (set BITSERVE_SCHEMA_PATH)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create the catalog or check its schema version\n"
            << "  " << argv0 << " --serve       # start the service (BITSERVE_PORT or 8000)\n";
}

static int serve(const Config& cfg) {
  // refuses a catalog written by an incompatible schema
  initDatabase(cfg.db_path, findSchemaPath(cfg));

  // SIGINT/SIGTERM are taken by a dedicated thread via sigwait; block them
  // before any other thread exists so every thread inherits the mask.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  CatalogStore catalog(cfg.db_path);
  DescriptorArchive archive(cfg.archive_dir);
  LibtorrentEngine engine({cfg.download_root, cfg.listen_interfaces});
  EventQueue events;
  WebhookDispatcher webhooks(events);

  LifecycleOptions opts;
  opts.max_active = static_cast<std::size_t>(cfg.max_active);
  opts.download_root = cfg.download_root;
  opts.session_path = cfg.session_path;
  LifecycleController lifecycle(catalog, archive, engine, events, opts);

  engine.open();
  const auto report = lifecycle.open();
  for (const auto& w : report.warnings) spdlog::warn("startup: {}", w);
  events.start();

  StatsFlusher flusher(lifecycle, std::chrono::seconds(cfg.flush_interval_sec));
  if (cfg.flush_interval_sec > 0) flusher.start();

  HttpServer http(lifecycle, webhooks, cfg.api_key);
  std::thread signals([&http, sigs] {
    int sig = 0;
    sigwait(&sigs, &sig);
    spdlog::info("signal {} received, shutting down", sig);
    http.stop();
  });

  const bool ok = http.listen("0.0.0.0", cfg.port);
  if (!ok) {
    // wake the signal thread so it can be joined
    pthread_kill(signals.native_handle(), SIGTERM);
  }
  signals.join();

  flusher.stop();
  lifecycle.close();
  events.stop();
  engine.close();
  return ok ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const Config cfg = loadConfig();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      const int version = initDatabase(cfg.db_path, findSchemaPath(cfg));
      std::cout << "catalog ready at " << cfg.db_path << " (schema v" << version << ")\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      return serve(cfg);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
