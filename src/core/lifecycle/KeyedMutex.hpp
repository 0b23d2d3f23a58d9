#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bitserve {

// One mutex per key, created on first use and dropped when the last holder
// or waiter lets go.
class KeyedMutex {
  struct Slot {
    std::mutex m;
    int users = 0;
  };

public:
  class Guard {
  public:
    Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Slot> slot)
      : owner_(&owner), key_(std::move(key)), slot_(std::move(slot)) {
      slot_->m.lock();
    }
    ~Guard() {
      if (!slot_) return;
      slot_->m.unlock();
      owner_->release(key_);
    }
    Guard(Guard&& o) noexcept
      : owner_(o.owner_), key_(std::move(o.key_)), slot_(std::move(o.slot_)) {}
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;

  private:
    KeyedMutex* owner_;
    std::string key_;
    std::shared_ptr<Slot> slot_;
  };

  Guard lock(const std::string& key) {
    std::shared_ptr<Slot> slot;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto& s = slots_[key];
      if (!s) s = std::make_shared<Slot>();
      ++s->users;
      slot = s;
    }
    return Guard(*this, key, std::move(slot));
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slots_.size();
  }

private:
  void release(const std::string& key) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(key);
    if (it != slots_.end() && --it->second->users == 0) slots_.erase(it);
  }

  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace bitserve
