#include "StatsFlusher.hpp"
#include <spdlog/spdlog.h>

#include "core/lifecycle/LifecycleController.hpp"

namespace bitserve {

StatsFlusher::StatsFlusher(LifecycleController& lifecycle, std::chrono::seconds interval)
  : lifecycle_(lifecycle), interval_(interval) {}

StatsFlusher::~StatsFlusher() {
  stop();
}

void StatsFlusher::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { loop(); });
  spdlog::info("periodic stats flush every {}s", interval_.count());
}

void StatsFlusher::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void StatsFlusher::loop() {
  std::unique_lock<std::mutex> lk(mtx_);
  while (!cv_.wait_for(lk, interval_, [this] { return stopping_; })) {
    lk.unlock();
    try {
      const auto n = lifecycle_.flushStats();
      spdlog::debug("periodic flush wrote {} item(s)", n);
    } catch (const std::exception& e) {
      spdlog::error("periodic stats flush failed: {}", e.what());
    }
    lk.lock();
  }
}

} // namespace bitserve
