#include "proxy_watchdog.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "process_supervisor.hpp"

namespace hosting::proxy {

using observability::IntField;
using observability::StringField;

WatchdogSettings WatchdogSettings::FromConfig(const hosting::runtime::config::ProxyConfig& config) {
  WatchdogSettings settings;
  settings.interval             = util::FromProto(config.watchdog_interval());
  settings.rapid_restart_limit  = config.rapid_restart_limit();
  settings.rapid_restart_window = util::FromProto(config.rapid_restart_window());
  return settings;
}

ProxyWatchdog::ProxyWatchdog(std::shared_ptr<ProcessSupervisor> supervisor, WatchdogSettings settings, util::ClockFn clock)
    : supervisor_(std::move(supervisor)), settings_(settings), clock_(std::move(clock)) {}

ProxyWatchdog::~ProxyWatchdog() {
  Stop();
}

util::TimePoint ProxyWatchdog::Now() const {
  return clock_ ? clock_() : util::Now();
}

void ProxyWatchdog::OnFatal(FatalCallback callback) {
  std::lock_guard lock(mutex_);
  on_fatal_ = std::move(callback);
}

void ProxyWatchdog::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&ProxyWatchdog::Run, this);
}

void ProxyWatchdog::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ProxyWatchdog::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, settings_.interval, [&] { return !running_; }))
      break;

    lock.unlock();
    Check();
    lock.lock();
  }
}

void ProxyWatchdog::Check() {
  if (fatal_.load()) {
    return;
  }
  if (!supervisor_->NeedsRecovery()) {
    // keeps the health reported by the admin API current
    if (!supervisor_->HealthCheck() && supervisor_->State() == model::ProxyState::kRunning) {
      HOSTING_LOG_DEBUG("Proxy health probe failed");
    }
    return;
  }

  // failed relaunches count against the same budget as crashes
  const auto now = Now();
  while (!restarts_.empty() && now - restarts_.front() > settings_.rapid_restart_window) {
    restarts_.pop_front();
  }

  if (restarts_.size() >= settings_.rapid_restart_limit) {
    HOSTING_LOG_ERROR("Proxy is crash looping, giving up",
                      {IntField("restarts", static_cast<std::int64_t>(restarts_.size())),
                       IntField("window_ms", static_cast<std::int64_t>(settings_.rapid_restart_window.count())),
                       StringField("state", model::ToString(supervisor_->State()))});
    fatal_ = true;

    FatalCallback callback;
    {
      std::lock_guard lock(mutex_);
      callback = on_fatal_;
    }
    if (callback) callback();
    return;
  }

  restarts_.push_back(now);
  HOSTING_LOG_WARN("Proxy is down, restarting",
                   {IntField("restart", static_cast<std::int64_t>(restarts_.size())), StringField("state", model::ToString(supervisor_->State()))});
  try {
    supervisor_->Restart();
  } catch (const util::StartupError& e) {
    HOSTING_LOG_ERROR("Proxy restart failed", {StringField("error", e.what())});
  }
}

} // namespace hosting::proxy
