#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/lifecycle/LifecycleController.hpp"
#include "services/webhooks/WebhookDispatcher.hpp"

using nlohmann::json;

namespace bitserve {

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void reply(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void detail(httplib::Response& res, int status, const std::string& msg) {
  reply(res, status, json{{"detail", msg}});
}

// Optional non-negative integer query parameter; false if malformed.
static bool int_param(const httplib::Request& req, const char* k, int64_t def, int64_t& out) {
  const std::string s = param_or(req, k);
  if (s.empty()) { out = def; return true; }
  try {
    std::size_t used = 0;
    out = std::stoll(s, &used);
    return used == s.size() && out >= 0;
  } catch (const std::exception&) {
    return false;
  }
}

static json item_json(const ItemView& v) {
  return {
    {"info_hash",        v.record.id},
    {"name",             v.status.name},
    {"progress",         v.status.progress_fraction * 100},
    {"download_rate",    v.status.download_rate / 1000.0},
    {"upload_rate",      v.status.upload_rate / 1000.0},
    {"status",           v.status.state},
    {"seedtime_hours",   v.status.seed_time / 3600.0},
    {"num_peers",        v.status.peer_count},
    {"bytes_uploaded",   v.status.bytes_uploaded},
    {"bytes_downloaded", v.status.bytes_downloaded},
    {"residency",        v.resident ? "active" : "inactive"}
  };
}

// -------- server --------

HttpServer::HttpServer(LifecycleController& lifecycle,
                       WebhookDispatcher& webhooks,
                       std::string apiKey)
  : lifecycle_(lifecycle),
    webhooks_(webhooks),
    apiKey_(std::move(apiKey)),
    svr_(std::make_unique<httplib::Server>()) {
  routes();
}

HttpServer::~HttpServer() = default;

void HttpServer::routes() {
  auto& svr = *svr_;

  // Health: fails while reconciliation left inconsistencies behind
  svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    const auto warnings = lifecycle_.consistencyWarnings();
    if (warnings.empty()) {
      res.status = 200;
      res.set_content("ok", "text/plain");
      return;
    }
    reply(res, 503, json{{"status", "inconsistent"}, {"warnings", warnings}});
  });

  // POST /add-torrents/   multipart, one or more "files" parts
  svr.Post("/add-torrents/", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    if (!req.is_multipart_form_data()) {
      detail(res, 422, "multipart field 'files' required");
      return;
    }

    std::vector<Upload> uploads;
    auto range = req.files.equal_range("files");
    for (auto it = range.first; it != range.second; ++it) {
      uploads.push_back({it->second.filename, it->second.content});
    }
    if (uploads.empty()) {
      detail(res, 422, "multipart field 'files' required");
      return;
    }

    const auto result = lifecycle_.addItems(uploads);
    json out = {{"success", json::array()}, {"errors", json::array()}};
    for (const auto& s : result.success) {
      out["success"].push_back({{"filename", s.filename}, {"info_hash", s.id}});
    }
    for (const auto& e : result.errors) {
      out["errors"].push_back({{"filename", e.filename}, {"error", e.reason}});
    }
    reply(res, 200, out);
  });

  // GET /torrents/?offset=&limit=
  svr.Get("/torrents/", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    int64_t offset = 0, limit = -1;
    if (!int_param(req, "offset", 0, offset) || !int_param(req, "limit", -1, limit)) {
      detail(res, 422, "offset and limit must be non-negative integers");
      return;
    }
    json out = json::array();
    try {
      for (const auto& v : lifecycle_.list(offset, limit)) out.push_back(item_json(v));
    } catch (const std::exception& e) {
      spdlog::error("list failed: {}", e.what());
      detail(res, 500, "list failed");
      return;
    }
    reply(res, 200, out);
  });

  // POST /remove-torrents/   {"info_hashes": [...], "remove_files": false}
  svr.Post("/remove-torrents/", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;

    std::vector<std::string> ids;
    bool removeFiles = false;
    try {
      const json j = json::parse(req.body);
      ids = j.at("info_hashes").get<std::vector<std::string>>();
      if (j.contains("remove_files")) removeFiles = j.at("remove_files").get<bool>();
    } catch (const json::exception& e) {
      detail(res, 422, std::string("invalid request body: ") + e.what());
      return;
    }

    const auto result = lifecycle_.removeItems(ids, removeFiles);
    if (result.removed.empty() && result.errors.empty()) {
      detail(res, 404, "Torrents not found.");
      return;
    }
    json out = {
      {"message",   "Torrents removal process completed."},
      {"removed",   result.removed},
      {"not_found", result.not_found},
      {"errors",    json::array()}
    };
    for (const auto& e : result.errors) out["errors"].push_back({{"info_hash", e.id}, {"error", e.reason}});
    reply(res, 200, out);
  });

  svr.Post(R"(/torrents/([0-9a-fA-F]+)/pause)", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    const std::string id = req.matches[1];
    try {
      const bool changed = lifecycle_.pause(id);
      reply(res, 200, json{{"info_hash", id}, {"paused", changed}});
    } catch (const NotFoundError& e) {
      detail(res, 404, e.what());
    } catch (const std::exception& e) {
      spdlog::error("pause {} failed: {}", id, e.what());
      detail(res, 500, e.what());
    }
  });

  svr.Post(R"(/torrents/([0-9a-fA-F]+)/resume)", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    const std::string id = req.matches[1];
    try {
      lifecycle_.resume(id);
      reply(res, 200, json{{"info_hash", id}, {"resumed", true}});
    } catch (const NotFoundError& e) {
      detail(res, 404, e.what());
    } catch (const std::exception& e) {
      spdlog::error("resume {} failed: {}", id, e.what());
      detail(res, 500, e.what());
    }
  });

  // POST /register-webhook/?event=<added|removed|paused|resumed|evicted>&url=...
  svr.Post("/register-webhook/", [this](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey_, res)) return;
    try {
      webhooks_.registerWebhook(param_or(req, "event"), param_or(req, "url"));
    } catch (const std::invalid_argument& e) {
      detail(res, 422, e.what());
      return;
    }
    reply(res, 200, json{{"message", "Webhook registered successfully."}});
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

bool HttpServer::listen(const std::string& host, int port) {
  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr_->listen(host, port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

int HttpServer::bindToAnyPort(const std::string& host) {
  const int port = svr_->bind_to_any_port(host);
  if (port < 0) spdlog::error("Failed to bind an ephemeral port on {}", host);
  else spdlog::info("HTTP server bound to http://{}:{}", host, port);
  return port;
}

bool HttpServer::listenAfterBind() {
  return svr_->listen_after_bind();
}

bool HttpServer::isRunning() const {
  return svr_->is_running();
}

void HttpServer::stop() {
  svr_->stop();
}

} // namespace bitserve
