#include "EventQueue.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace bitserve {

const char* toString(EventType t) {
  switch (t) {
    case EventType::added:   return "added";
    case EventType::removed: return "removed";
    case EventType::paused:  return "paused";
    case EventType::resumed: return "resumed";
    case EventType::evicted: return "evicted";
  }
  return "unknown";
}

EventQueue::~EventQueue() {
  stop();
}

void EventQueue::subscribe(Subscriber s) {
  std::lock_guard<std::mutex> lk(mtx_);
  subscribers_.push_back(std::move(s));
}

void EventQueue::publish(LifecycleEvent ev) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shutdown_) {
      spdlog::debug("event queue stopped, dropping {} event for {}", toString(ev.type), ev.id);
      return;
    }
    q_.emplace_back(std::move(ev));
  }
  cv_.notify_one();
}

void EventQueue::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (worker_.joinable()) return;
  shutdown_ = false;
  worker_ = std::thread([this] { workerLoop(); });
}

void EventQueue::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void EventQueue::workerLoop() {
  while (true) {
    LifecycleEvent ev;
    std::vector<Subscriber> subs;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this] { return shutdown_ || !q_.empty(); });
      if (q_.empty()) return; // shutdown and drained
      ev = std::move(q_.front());
      q_.pop_front();
      subs = subscribers_;
    }
    for (auto& s : subs) {
      try {
        s(ev);
      } catch (const std::exception& e) {
        spdlog::warn("{} event subscriber failed for {}: {}", toString(ev.type), ev.id, e.what());
      }
    }
  }
}

} // namespace bitserve
