#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace hosting::proxy {

struct PurgeRequest {
  std::string session_id;

  // Only cached URL paths matching this are dropped; all when unset.
  std::optional<std::regex> path_pattern;
};

/*
  Capability interface of a supervised web proxy.

  The supervisor owns the lifecycle protocol (staging, rollback, retries);
  implementations only know how to drive one process.
*/
class WebProxy {
 public:
  virtual ~WebProxy() = default;

  virtual std::string Name() const = 0;

  // Syntax check of a configuration file. Throws util::ConfigInvalid.
  virtual void Validate(const std::string& config_path) = 0;

  // Launches the process bound to config_path. Throws util::StartupError.
  virtual void Start(const std::string& config_path) = 0;

  // Blocks until the process serves or the timeout elapses.
  virtual bool WaitReady(std::chrono::milliseconds timeout) = 0;

  // Asks the running process to re-read its configuration. Throws
  // util::ReloadError.
  virtual void Reload() = 0;

  // Graceful stop bounded by timeout, then forced. Always leaves no process.
  virtual void Stop(std::chrono::milliseconds timeout) = 0;

  // Process alive (reaps it when it has exited).
  virtual bool Running() = 0;

  // Running and, when configured, accepting connections.
  virtual bool HealthCheck() = 0;

  // 0 when there is no process.
  virtual int Pid() const = 0;

  // Drops cached content of a session. Throws util::UpstreamError.
  virtual std::size_t Purge(const PurgeRequest& request) = 0;
};

} // namespace hosting::proxy
