#include "WebhookDispatcher.hpp"
#include <stdexcept>
#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace bitserve {

static bool knownEvent(const std::string& e) {
  for (auto t : {EventType::added, EventType::removed, EventType::paused,
                 EventType::resumed, EventType::evicted}) {
    if (e == toString(t)) return true;
  }
  return false;
}

// "http://host:port/path" -> ("http://host:port", "/path")
static std::pair<std::string, std::string> splitUrl(const std::string& url) {
  const auto scheme = url.find("://");
  const auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (slash == std::string::npos) return {url, "/"};
  return {url.substr(0, slash), url.substr(slash)};
}

WebhookDispatcher::WebhookDispatcher(EventQueue& events) {
  events.subscribe([this](const LifecycleEvent& ev) { deliver(ev); });
}

void WebhookDispatcher::registerWebhook(const std::string& event, const std::string& url) {
  if (!knownEvent(event)) throw std::invalid_argument("unknown event '" + event + "'");
  const bool https = url.rfind("https://", 0) == 0;
  if (url.rfind("http://", 0) != 0 && !https) {
    throw std::invalid_argument("webhook url must be http(s): '" + url + "'");
  }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
  if (https) {
    throw std::invalid_argument("https webhooks need cpp-httplib built with OpenSSL: '" + url + "'");
  }
#endif
  std::lock_guard<std::mutex> lk(mtx_);
  hooks_.push_back({event, url});
  spdlog::info("webhook registered: {} -> {}", event, url);
}

std::vector<WebhookDispatcher::Hook> WebhookDispatcher::hooks() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return hooks_;
}

void WebhookDispatcher::deliver(const LifecycleEvent& ev) {
  const std::string event = toString(ev.type);
  const std::string body = json{
    {"event", event}, {"info_hash", ev.id}, {"name", ev.name}, {"at", ev.at}
  }.dump();

  for (const auto& hook : hooks()) {
    if (hook.event != event) continue;
    try {
      post(hook.url, body);
    } catch (const std::exception& e) {
      spdlog::warn("Failed to send webhook to {}: {}", hook.url, e.what());
    }
  }
}

void WebhookDispatcher::post(const std::string& url, const std::string& body) {
  const auto [base, path] = splitUrl(url);
  httplib::Client cli(base);
  cli.set_connection_timeout(5);
  cli.set_read_timeout(5);
  auto res = cli.Post(path, body, "application/json");
  if (!res) {
    spdlog::warn("Failed to send webhook to {}: {}", url, httplib::to_string(res.error()));
  } else if (res->status >= 400) {
    spdlog::warn("webhook {} answered {}", url, res->status);
  }
}

} // namespace bitserve
