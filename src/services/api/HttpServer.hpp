#pragma once
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace bitserve {

class LifecycleController;
class WebhookDispatcher;

class HttpServer {
public:
  // apiKey: if empty, auth is disabled.
  HttpServer(LifecycleController& lifecycle,
             WebhookDispatcher& webhooks,
             std::string apiKey);
  ~HttpServer();

  // Blocks until stop() is called or binding fails (returns false then).
  bool listen(const std::string& host, int port);

  // Two-step variant: bind an ephemeral port (returned, -1 on failure), then
  // serve on it until stop().
  int bindToAnyPort(const std::string& host);
  bool listenAfterBind();
  bool isRunning() const;

  void stop();

private:
  void routes();

  LifecycleController& lifecycle_;
  WebhookDispatcher& webhooks_;
  std::string apiKey_;
  std::unique_ptr<httplib::Server> svr_;
};

} // namespace bitserve
