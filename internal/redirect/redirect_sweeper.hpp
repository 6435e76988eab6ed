#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace hosting::redirect {

class RedirectTable;

/*
  Background worker that reclaims expired redirect entries.

  Lookups already ignore expired entries; this only bounds memory for
  scopes that stop receiving traffic.
*/
class RedirectSweeper {
 public:
  RedirectSweeper(std::shared_ptr<RedirectTable> table, std::chrono::milliseconds interval);
  ~RedirectSweeper();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<RedirectTable> table_;
  std::chrono::milliseconds      interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace hosting::redirect
