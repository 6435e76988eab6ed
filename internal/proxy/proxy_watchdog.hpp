#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace hosting::runtime::config {
class ProxyConfig;
}

namespace hosting::proxy {

class ProcessSupervisor;

struct WatchdogSettings {
  std::chrono::milliseconds interval{1000};
  std::uint32_t             rapid_restart_limit = 5;
  std::chrono::milliseconds rapid_restart_window{10000};

  static WatchdogSettings FromConfig(const hosting::runtime::config::ProxyConfig& config);
};

/*
  Background worker that relaunches the proxy after an unexpected exit, or
  when a start or reload left it Failed. A relaunch that fails is retried on
  the next pass.

  More than rapid_restart_limit restarts within rapid_restart_window is
  treated as a crash loop: the watchdog stops restarting, raises Fatal() and
  calls the fatal callback so the main loop can exit.
*/
class ProxyWatchdog {
 public:
  using FatalCallback = std::function<void()>;

  ProxyWatchdog(std::shared_ptr<ProcessSupervisor> supervisor, WatchdogSettings settings, util::ClockFn clock = {});
  ~ProxyWatchdog();

  void Start();
  void Stop();

  void OnFatal(FatalCallback callback);

  bool Fatal() const {
    return fatal_.load();
  }

  // One watchdog pass; exposed for tests.
  void Check();

 private:
  void            Run();
  util::TimePoint Now() const;

  std::shared_ptr<ProcessSupervisor> supervisor_;
  WatchdogSettings                   settings_;
  util::ClockFn                      clock_;

  std::deque<util::TimePoint> restarts_;
  std::atomic<bool>           fatal_{false};
  FatalCallback               on_fatal_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace hosting::proxy
