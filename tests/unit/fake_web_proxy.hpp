#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

#include "internal/proxy/web_proxy.hpp"
#include "internal/util/errors.hpp"

namespace hosting::testing {

/*
  Scriptable WebProxy for supervisor and store tests.

  Behaviour is keyed on the text of the artifact: Validate rejects files
  containing reject_marker, and WaitReady fails while the active artifact
  contains unhealthy_marker.
*/
class FakeWebProxy : public hosting::proxy::WebProxy {
 public:
  std::string Name() const override {
    return "fake";
  }

  void Validate(const std::string& config_path) override {
    std::lock_guard lock(mutex);
    ++validations;
    validated.push_back(Read(config_path));
    if (!reject_marker.empty() && validated.back().find(reject_marker) != std::string::npos) {
      throw hosting::util::ConfigInvalid("rejected " + config_path);
    }
  }

  void Start(const std::string& config_path) override {
    std::lock_guard lock(mutex);
    ++starts;
    if (failing_starts > 0) {
      --failing_starts;
      throw hosting::util::StartupError("scripted start failure");
    }
    active_path = config_path;
    alive       = true;
    pid         = ++next_pid;
  }

  bool WaitReady(std::chrono::milliseconds) override {
    std::lock_guard lock(mutex);
    return alive && !ActiveIsUnhealthy();
  }

  void Reload() override {
    std::lock_guard lock(mutex);
    if (!alive) {
      throw hosting::util::ReloadError("not running");
    }
    ++reloads;
  }

  void Stop(std::chrono::milliseconds) override {
    std::lock_guard lock(mutex);
    ++stops;
    alive = false;
    pid   = 0;
  }

  bool Running() override {
    std::lock_guard lock(mutex);
    return alive;
  }

  bool HealthCheck() override {
    std::lock_guard lock(mutex);
    return alive && !ActiveIsUnhealthy();
  }

  int Pid() const override {
    std::lock_guard lock(mutex);
    return pid;
  }

  std::size_t Purge(const hosting::proxy::PurgeRequest& request) override {
    std::lock_guard lock(mutex);
    purged_sessions.push_back(request.session_id);
    if (purge_fails) {
      throw hosting::util::UpstreamError("scripted purge failure");
    }
    return purge_result;
  }

  // Simulates the process dying on its own.
  void Crash() {
    std::lock_guard lock(mutex);
    alive = false;
    pid   = 0;
  }

  // Text of the artifact the proxy currently serves (through the symlink).
  std::string ActiveText() const {
    std::lock_guard lock(mutex);
    return Read(active_path);
  }

  mutable std::mutex mutex;

  std::string reject_marker;
  std::string unhealthy_marker;
  int         failing_starts = 0;
  bool        purge_fails    = false;
  std::size_t purge_result   = 0;

  bool        alive       = false;
  int         pid         = 0;
  int         next_pid    = 1000;
  int         starts      = 0;
  int         reloads     = 0;
  int         stops       = 0;
  int         validations = 0;
  std::string active_path;

  std::vector<std::string> validated;
  std::vector<std::string> purged_sessions;

 private:
  static std::string Read(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  bool ActiveIsUnhealthy() const {
    return !unhealthy_marker.empty() && Read(active_path).find(unhealthy_marker) != std::string::npos;
  }
};

inline std::filesystem::path FreshDirectory(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "hosting_controller_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace hosting::testing
