#include <gtest/gtest.h>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "core/lifecycle/EventQueue.hpp"
#include "services/webhooks/WebhookDispatcher.hpp"

using namespace bitserve;
using nlohmann::json;

namespace {

// Local receiver recording every POSTed body.
class Receiver {
public:
  Receiver() {
    svr_.Post("/hook", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mtx_);
      bodies_.push_back(req.body);
      res.status = 204;
    });
    port_ = svr_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { svr_.listen_after_bind(); });
    while (!svr_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ~Receiver() {
    svr_.stop();
    thread_.join();
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/hook"; }
  std::vector<std::string> bodies() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return bodies_;
  }

private:
  httplib::Server svr_;
  int port_ = 0;
  std::thread thread_;
  mutable std::mutex mtx_;
  std::vector<std::string> bodies_;
};

} // namespace

TEST(WebhookDispatcherTest, RejectsUnknownEventsAndSchemes) {
  EventQueue events;
  WebhookDispatcher hooks(events);
  EXPECT_THROW(hooks.registerWebhook("downloaded", "http://127.0.0.1/x"), std::invalid_argument);
  EXPECT_THROW(hooks.registerWebhook("added", "ftp://127.0.0.1/x"), std::invalid_argument);
  EXPECT_THROW(hooks.registerWebhook("added", "127.0.0.1/x"), std::invalid_argument);
  EXPECT_TRUE(hooks.hooks().empty());
}

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
TEST(WebhookDispatcherTest, HttpsNeedsTlsSupport) {
  EventQueue events;
  WebhookDispatcher hooks(events);
  EXPECT_THROW(hooks.registerWebhook("added", "https://example.org/hook"), std::invalid_argument);
  EXPECT_TRUE(hooks.hooks().empty());
}
#endif

TEST(WebhookDispatcherTest, PostsEventPayloadToMatchingHooks) {
  Receiver rx;
  EventQueue events;
  WebhookDispatcher hooks(events);
  hooks.registerWebhook("added", rx.url());
  events.start();

  events.publish({EventType::added, "aa01", "ubuntu.iso", 1700000000});
  events.publish({EventType::removed, "aa01", "ubuntu.iso", 1700000001});
  events.stop();

  const auto bodies = rx.bodies();
  ASSERT_EQ(bodies.size(), 1u);
  const auto payload = json::parse(bodies[0]);
  EXPECT_EQ(payload["event"], "added");
  EXPECT_EQ(payload["info_hash"], "aa01");
  EXPECT_EQ(payload["name"], "ubuntu.iso");
  EXPECT_EQ(payload["at"], 1700000000);
}

TEST(WebhookDispatcherTest, UnreachableHookDoesNotBlockLaterHooks) {
  Receiver rx;
  EventQueue events;
  WebhookDispatcher hooks(events);
  // nothing listens on port 1
  hooks.registerWebhook("evicted", "http://127.0.0.1:1/hook");
  hooks.registerWebhook("evicted", rx.url());
  events.start();

  events.publish({EventType::evicted, "aa02", "old", 5});
  events.stop();

  ASSERT_EQ(rx.bodies().size(), 1u);
  EXPECT_EQ(json::parse(rx.bodies()[0])["info_hash"], "aa02");
}
