#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bitserve {

enum class EventType { added, removed, paused, resumed, evicted };

const char* toString(EventType t);

struct LifecycleEvent {
  EventType   type;
  std::string id;
  std::string name;
  int64_t     at = 0; // seconds since epoch
};

// Outbound queue for lifecycle notifications. publish() only enqueues;
// subscribers run on the queue's own worker thread and anything they throw is
// logged there, never seen by the publisher.
class EventQueue {
public:
  using Subscriber = std::function<void(const LifecycleEvent&)>;

  EventQueue() = default;
  ~EventQueue();

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void subscribe(Subscriber s);
  void publish(LifecycleEvent ev);

  void start();
  // Delivers what is already queued, then joins the worker.
  void stop();

private:
  void workerLoop();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<LifecycleEvent> q_;
  std::vector<Subscriber> subscribers_;
  bool shutdown_ = false;
  std::thread worker_;
};

} // namespace bitserve
