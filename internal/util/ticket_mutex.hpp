#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace hosting::util {

/*
  FIFO mutex.

  Waiters are admitted strictly in arrival order, so a stream of provisioning
  calls can never starve an earlier caller. Satisfies Lockable, usable with
  std::lock_guard / std::unique_lock.
*/
class TicketMutex {
 public:
  TicketMutex()                              = default;
  TicketMutex(const TicketMutex&)            = delete;
  TicketMutex& operator=(const TicketMutex&) = delete;

  void lock() {
    std::unique_lock guard(mutex_);
    const auto ticket = next_ticket_++;
    cv_.wait(guard, [&] { return serving_ == ticket; });
  }

  bool try_lock() {
    std::lock_guard guard(mutex_);
    if (serving_ != next_ticket_) {
      return false;
    }
    ++next_ticket_;
    return true;
  }

  void unlock() {
    {
      std::lock_guard guard(mutex_);
      ++serving_;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  uint64_t                next_ticket_ = 0;
  uint64_t                serving_     = 0;
};

} // namespace hosting::util
