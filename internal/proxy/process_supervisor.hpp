#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "artifact_store.hpp"
#include "internal/model/proxy_state.hpp"
#include "web_proxy.hpp"

namespace hosting::runtime::config {
class ProxyConfig;
}

namespace hosting::proxy {

// Cumulative since construction; exported through the admin status.
struct SupervisorCounters {
  std::uint64_t reloads   = 0;
  std::uint64_t rollbacks = 0;
  std::uint64_t restarts  = 0;
};

struct SupervisorSettings {
  std::chrono::milliseconds readiness_timeout{5000};
  std::chrono::milliseconds shutdown_timeout{10000};
  std::chrono::milliseconds retry_backoff{250};
  std::uint32_t             start_attempts = 3;

  static SupervisorSettings FromConfig(const hosting::runtime::config::ProxyConfig& config);
};

/*
  Lifecycle and reload protocol of the one supervised proxy process.

      Stopped -> Starting -> Running <-> Reloading
      Starting / Reloading -> Failed

  Every artifact is staged at its own versioned path and syntax checked
  before it becomes active. The last artifact the proxy accepted and served
  with ("last known good") is what rollback and Restart return to.

  Operations are serialized internally; State() and AppliedVersion() never
  block behind a running operation.
*/
class ProcessSupervisor {
 public:
  ProcessSupervisor(std::shared_ptr<WebProxy> proxy, ArtifactStore artifacts, SupervisorSettings settings);

  ProcessSupervisor(const ProcessSupervisor&)            = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Throws util::ConfigInvalid, util::StartupError. Returns the applied
  // version. When a previously applied artifact exists and the new one
  // fails to launch, the proxy is relaunched once on the old artifact
  // before StartupError is raised.
  std::uint64_t Start(const std::string& artifact);

  // Throws util::ConfigInvalid, util::ReloadError.
  std::uint64_t Reload(const std::string& artifact);

  // Reload when a healthy process runs, Start otherwise.
  std::uint64_t Apply(const std::string& artifact);

  void Stop();

  bool HealthCheck();

  // Relaunches the last known good artifact. Throws util::StartupError.
  void Restart();

  // Running according to the state machine, but the process is gone.
  bool ExitedUnexpectedly();

  // ExitedUnexpectedly, or Failed after a start or reload gave up.
  bool NeedsRecovery();

  SupervisorCounters Counters() const;

  model::ProxyState State() const {
    return state_.load();
  }

  std::uint64_t AppliedVersion() const {
    return applied_version_.load();
  }

  bool LastHealth() const {
    return last_health_.load();
  }

  int Pid() const {
    return proxy_->Pid();
  }

  WebProxy& Proxy() {
    return *proxy_;
  }

  const ArtifactStore& Artifacts() const {
    return artifacts_;
  }

 private:
  std::uint64_t StartLocked(const std::string& artifact);
  std::uint64_t ReloadLocked(const std::string& artifact);
  void          StopLocked();

  // Stages and syntax checks; the staged file is removed when rejected.
  std::string StageLocked(std::uint64_t version, const std::string& artifact);

  // Launch with bounded retries. Leaves the state Running or Failed.
  void LaunchLocked();

  // Relaunches good_path_ after `version` failed to start. Always throws
  // util::StartupError; the state is Running when the relaunch worked.
  void RecoverStartLocked(std::uint64_t version, const std::string& failure);

  void Commit(std::uint64_t version, const std::string& path);
  void Transition(model::ProxyState next);

  std::shared_ptr<WebProxy> proxy_;
  ArtifactStore             artifacts_;
  SupervisorSettings        settings_;

  std::mutex                     mutex_;
  std::atomic<model::ProxyState> state_{model::ProxyState::kStopped};
  std::atomic<std::uint64_t>     applied_version_{0};
  std::atomic<bool>              last_health_{false};
  std::uint64_t                  next_version_ = 0;
  std::string                    good_path_;

  struct {
    std::atomic<std::uint64_t> reloads{0};
    std::atomic<std::uint64_t> rollbacks{0};
    std::atomic<std::uint64_t> restarts{0};
  } counters_;
};

} // namespace hosting::proxy
