#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "child_process.hpp"
#include "web_proxy.hpp"

namespace hosting::runtime::config {
class ProxyConfig;
}

namespace hosting::proxy {

struct NginxSettings {
  std::string executable = "nginx";
  std::string error_log;
  std::string cache_dir;

  // Created before every start; nginx refuses to run without them.
  std::vector<std::string> directories;

  // host:port. Empty means liveness only, which cannot catch a failed
  // reload since the master survives SIGHUP; the config loader always
  // fills it in.
  std::string health_probe_address;

  std::chrono::milliseconds command_timeout{10000};
  std::chrono::milliseconds probe_timeout{1000};

  static NginxSettings FromConfig(const hosting::runtime::config::ProxyConfig& config);
};

/*
  nginx driven as a foreground child process.

  Command-line flags are probed once through "nginx -h" so older builds
  without -e still start. Cache purge walks the cache directory and matches
  the "KEY:" header nginx writes into every cache file, whose value is the
  proxy_cache_key "<session>:u=<path>" the generated configuration sets.
*/
class NginxProxy : public WebProxy {
 public:
  explicit NginxProxy(NginxSettings settings);
  ~NginxProxy() override;

  std::string Name() const override {
    return "nginx";
  }

  void        Validate(const std::string& config_path) override;
  void        Start(const std::string& config_path) override;
  bool        WaitReady(std::chrono::milliseconds timeout) override;
  void        Reload() override;
  void        Stop(std::chrono::milliseconds timeout) override;
  bool        Running() override;
  bool        HealthCheck() override;
  int         Pid() const override;
  std::size_t Purge(const PurgeRequest& request) override;

  // Full command line used to launch nginx for config_path.
  std::vector<std::string> CommandLine(const std::string& config_path);

 private:
  const std::set<std::string>& SupportedFlags();
  void                         EnsureDirectories() const;
  bool                         ProbeConnect() const;

  NginxSettings settings_;

  mutable std::mutex                   mutex_;
  ChildProcess                         child_;
  std::optional<std::set<std::string>> supported_flags_;
};

// Splits a cache key "<session>:u=<path>". False for keys not written by
// the generated configuration.
bool ParseCacheKey(const std::string& key, std::string* session_id, std::string* path);

// Reads the KEY header from the start of an nginx cache file.
std::optional<std::string> ReadCacheKey(const std::string& file);

} // namespace hosting::proxy
