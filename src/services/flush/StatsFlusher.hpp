#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace bitserve {

class LifecycleController;

// Calls flushStats() every interval until stopped.
class StatsFlusher {
public:
  StatsFlusher(LifecycleController& lifecycle, std::chrono::seconds interval);
  ~StatsFlusher();

  StatsFlusher(const StatsFlusher&) = delete;
  StatsFlusher& operator=(const StatsFlusher&) = delete;

  void start();
  void stop();

private:
  void loop();

  LifecycleController& lifecycle_;
  const std::chrono::seconds interval_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace bitserve
