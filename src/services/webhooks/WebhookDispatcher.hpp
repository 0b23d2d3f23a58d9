#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "core/lifecycle/EventQueue.hpp"

namespace bitserve {

// Registered (event, url) pairs; delivery happens on the EventQueue worker.
class WebhookDispatcher {
public:
  struct Hook {
    std::string event;
    std::string url;
  };

  // Subscribes to the queue for the dispatcher's whole lifetime, so the
  // dispatcher must outlive the queue's worker.
  explicit WebhookDispatcher(EventQueue& events);

  // Throws std::invalid_argument for unknown events, non-http(s) urls, and
  // https urls when the HTTP client was built without TLS.
  void registerWebhook(const std::string& event, const std::string& url);

  std::vector<Hook> hooks() const;

private:
  void deliver(const LifecycleEvent& ev);
  void post(const std::string& url, const std::string& body);

  mutable std::mutex mtx_;
  std::vector<Hook> hooks_;
};

} // namespace bitserve
