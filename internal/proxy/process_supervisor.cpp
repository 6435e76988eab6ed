#include "process_supervisor.hpp"

#include <stdexcept>
#include <thread>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hosting::proxy {

using model::ProxyState;
using observability::IntField;
using observability::StringField;

namespace {

void RecordOperation(std::string_view operation, bool success) {
  observability::Metrics::Instance().RecordProxyOperation(operation, success);
}

} // namespace

SupervisorSettings SupervisorSettings::FromConfig(const hosting::runtime::config::ProxyConfig& config) {
  SupervisorSettings settings;
  settings.readiness_timeout = util::FromProto(config.readiness_timeout());
  settings.shutdown_timeout  = util::FromProto(config.shutdown_timeout());
  settings.retry_backoff     = util::FromProto(config.retry_backoff());
  settings.start_attempts    = config.start_attempts() == 0 ? 1 : config.start_attempts();
  return settings;
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<WebProxy> proxy, ArtifactStore artifacts, SupervisorSettings settings)
    : proxy_(std::move(proxy)), artifacts_(std::move(artifacts)), settings_(settings) {
  if (!proxy_) {
    throw std::invalid_argument("process supervisor requires a proxy");
  }
}

void ProcessSupervisor::Transition(ProxyState next) {
  const auto current = state_.load();
  if (!model::CanTransition(current, next)) {
    throw std::logic_error("invalid proxy state transition " + std::string(model::ToString(current)) + " -> " + std::string(model::ToString(next)));
  }
  if (current != next) {
    HOSTING_LOG_DEBUG("Proxy state", {StringField("from", model::ToString(current)), StringField("to", model::ToString(next))});
  }
  state_ = next;
}

void ProcessSupervisor::Commit(std::uint64_t version, const std::string& path) {
  const auto previous = good_path_;
  good_path_          = path;
  applied_version_    = version;
  last_health_        = true;

  // active + rollback candidate
  artifacts_.Prune({path, previous});
}

std::string ProcessSupervisor::StageLocked(std::uint64_t version, const std::string& artifact) {
  std::string path;
  try {
    path = artifacts_.Stage(version, artifact);
  } catch (const std::runtime_error& e) {
    throw util::ConfigInvalid(std::string("cannot stage artifact: ") + e.what());
  }

  try {
    proxy_->Validate(path);
  } catch (const util::ConfigInvalid&) {
    artifacts_.Discard(path);
    throw;
  }
  return path;
}

void ProcessSupervisor::LaunchLocked() {
  const auto active  = artifacts_.ActivePath();
  auto       backoff = settings_.retry_backoff;
  std::string last_error;

  Transition(ProxyState::kStarting);
  for (std::uint32_t attempt = 1; attempt <= settings_.start_attempts; ++attempt) {
    try {
      proxy_->Start(active);
      if (proxy_->WaitReady(settings_.readiness_timeout)) {
        Transition(ProxyState::kRunning);
        return;
      }
      last_error = "not ready within " + std::to_string(settings_.readiness_timeout.count()) + "ms";
    } catch (const util::StartupError& e) {
      last_error = e.what();
    }

    proxy_->Stop(settings_.shutdown_timeout);
    HOSTING_LOG_WARN("Proxy start attempt failed", {IntField("attempt", attempt), StringField("error", last_error)});

    if (attempt < settings_.start_attempts) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  last_health_ = false;
  Transition(ProxyState::kFailed);
  throw util::StartupError(proxy_->Name() + " failed to start after " + std::to_string(settings_.start_attempts) + " attempts: " + last_error);
}

std::uint64_t ProcessSupervisor::StartLocked(const std::string& artifact) {
  if (!model::HasNoProcess(state_.load())) {
    throw util::StartupError(proxy_->Name() + " is already " + std::string(model::ToString(state_.load())));
  }

  const auto version = ++next_version_;
  const auto path    = StageLocked(version, artifact);

  try {
    artifacts_.Activate(path);
  } catch (const std::runtime_error& e) {
    artifacts_.Discard(path);
    throw util::StartupError(e.what());
  }

  try {
    LaunchLocked();
  } catch (const util::StartupError& e) {
    artifacts_.Discard(path);
    if (good_path_.empty()) {
      RecordOperation("start", false);
      throw;
    }
    RecoverStartLocked(version, e.what());
  }

  Commit(version, path);
  RecordOperation("start", true);
  HOSTING_LOG_INFO("Proxy started", {IntField("version", static_cast<std::int64_t>(version)), IntField("pid", proxy_->Pid())});
  return version;
}

void ProcessSupervisor::RecoverStartLocked(std::uint64_t version, const std::string& failure) {
  HOSTING_LOG_WARN("Start failed, rolling back", {IntField("version", static_cast<std::int64_t>(version)), StringField("error", failure)});
  ++counters_.rollbacks;

  // one relaunch on the last known good artifact
  try {
    artifacts_.Activate(good_path_);
    LaunchLocked();
  } catch (const std::runtime_error& e) {
    if (state_.load() != ProxyState::kFailed) {
      last_health_ = false;
      Transition(ProxyState::kFailed);
    }
    RecordOperation("start", false);
    RecordOperation("rollback", false);
    throw util::StartupError("start of version " + std::to_string(version) + " failed and rollback did not recover: " + failure + "; " +
                             e.what());
  }

  last_health_ = true;
  RecordOperation("start", false);
  RecordOperation("rollback", true);
  HOSTING_LOG_INFO("Proxy running last known good artifact", {IntField("version", static_cast<std::int64_t>(applied_version_.load())),
                                                               IntField("pid", proxy_->Pid())});
  throw util::StartupError("start of version " + std::to_string(version) + " failed and was rolled back: " + failure);
}

std::uint64_t ProcessSupervisor::ReloadLocked(const std::string& artifact) {
  if (state_.load() != ProxyState::kRunning) {
    throw util::ReloadError(proxy_->Name() + " is not running");
  }

  const auto version = ++next_version_;
  const auto path    = StageLocked(version, artifact);

  std::string failure;
  try {
    artifacts_.Activate(path);
    Transition(ProxyState::kReloading);
    proxy_->Reload();
    if (proxy_->WaitReady(settings_.readiness_timeout)) {
      Transition(ProxyState::kRunning);
      Commit(version, path);
      ++counters_.reloads;
      RecordOperation("reload", true);
      HOSTING_LOG_INFO("Proxy reloaded", {IntField("version", static_cast<std::int64_t>(version))});
      return version;
    }
    failure = "not healthy within " + std::to_string(settings_.readiness_timeout.count()) + "ms";
  } catch (const util::ReloadError& e) {
    failure = e.what();
  } catch (const std::runtime_error& e) {
    artifacts_.Discard(path);
    RecordOperation("reload", false);
    throw util::ReloadError(e.what());
  }

  RecordOperation("reload", false);
  HOSTING_LOG_WARN("Reload failed, rolling back", {IntField("version", static_cast<std::int64_t>(version)), StringField("error", failure)});
  if (state_.load() == ProxyState::kRunning) {
    Transition(ProxyState::kReloading);
  }

  // one rollback to the last known good artifact
  bool recovered = false;
  if (!good_path_.empty()) {
    ++counters_.rollbacks;
    try {
      artifacts_.Activate(good_path_);
      proxy_->Reload();
      recovered = proxy_->WaitReady(settings_.readiness_timeout);
    } catch (const std::runtime_error& e) {
      HOSTING_LOG_ERROR("Rollback failed", {StringField("error", e.what())});
    }
  }
  artifacts_.Discard(path);
  RecordOperation("rollback", recovered);

  if (recovered) {
    Transition(ProxyState::kRunning);
    last_health_ = true;
    throw util::ReloadError("reload of version " + std::to_string(version) + " failed and was rolled back: " + failure);
  }

  proxy_->Stop(settings_.shutdown_timeout);
  last_health_ = false;
  Transition(ProxyState::kFailed);
  throw util::ReloadError("reload of version " + std::to_string(version) + " failed and rollback did not recover: " + failure);
}

void ProcessSupervisor::StopLocked() {
  proxy_->Stop(settings_.shutdown_timeout);
  last_health_ = false;
  Transition(ProxyState::kStopped);
}

std::uint64_t ProcessSupervisor::Start(const std::string& artifact) {
  std::lock_guard lock(mutex_);
  return StartLocked(artifact);
}

std::uint64_t ProcessSupervisor::Reload(const std::string& artifact) {
  std::lock_guard lock(mutex_);
  return ReloadLocked(artifact);
}

std::uint64_t ProcessSupervisor::Apply(const std::string& artifact) {
  std::lock_guard lock(mutex_);
  if (state_.load() == ProxyState::kRunning && proxy_->HealthCheck()) {
    return ReloadLocked(artifact);
  }

  if (!model::HasNoProcess(state_.load()) || proxy_->Running()) {
    HOSTING_LOG_WARN("Proxy unhealthy, restarting instead of reloading", {StringField("state", model::ToString(state_.load()))});
    StopLocked();
  }
  return StartLocked(artifact);
}

void ProcessSupervisor::Stop() {
  std::lock_guard lock(mutex_);
  StopLocked();
}

bool ProcessSupervisor::HealthCheck() {
  std::lock_guard lock(mutex_);
  const bool healthy = state_.load() == ProxyState::kRunning && proxy_->HealthCheck();
  last_health_       = healthy;
  return healthy;
}

bool ProcessSupervisor::ExitedUnexpectedly() {
  std::lock_guard lock(mutex_);
  return state_.load() == ProxyState::kRunning && !proxy_->Running();
}

bool ProcessSupervisor::NeedsRecovery() {
  std::lock_guard lock(mutex_);
  const auto state = state_.load();
  return state == ProxyState::kFailed || (state == ProxyState::kRunning && !proxy_->Running());
}

SupervisorCounters ProcessSupervisor::Counters() const {
  SupervisorCounters counters;
  counters.reloads   = counters_.reloads.load();
  counters.rollbacks = counters_.rollbacks.load();
  counters.restarts  = counters_.restarts.load();
  return counters;
}

void ProcessSupervisor::Restart() {
  std::lock_guard lock(mutex_);
  if (good_path_.empty()) {
    throw util::StartupError("no applied artifact to restart " + proxy_->Name() + " with");
  }

  ++counters_.restarts;
  proxy_->Stop(settings_.shutdown_timeout);
  Transition(ProxyState::kStarting);
  try {
    artifacts_.Activate(good_path_);
  } catch (const std::runtime_error& e) {
    last_health_ = false;
    Transition(ProxyState::kFailed);
    RecordOperation("restart", false);
    throw util::StartupError(e.what());
  }

  try {
    LaunchLocked();
  } catch (const util::StartupError&) {
    RecordOperation("restart", false);
    throw;
  }
  last_health_ = true;
  RecordOperation("restart", true);
  HOSTING_LOG_INFO("Proxy restarted", {IntField("version", static_cast<std::int64_t>(applied_version_.load())), IntField("pid", proxy_->Pid())});
}

} // namespace hosting::proxy
