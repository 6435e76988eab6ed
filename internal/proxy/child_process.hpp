#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hosting::proxy {

struct ExitStatus {
  int code   = -1;  // valid when signal == 0
  int signal = 0;

  bool Success() const {
    return signal == 0 && code == 0;
  }

  std::string Describe() const;
};

struct CommandResult {
  ExitStatus  status;
  std::string output;  // stdout and stderr interleaved
};

// Runs argv to completion and captures its output. The command is killed
// when it outlives timeout. Throws util::UpstreamError when it cannot be
// launched at all.
CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

/*
  Owned child process.

  argv[0] is looked up on PATH. The destructor kills and reaps a child that
  is still running, so a ChildProcess never leaks a process or a zombie.
*/
class ChildProcess {
 public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess&)            = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  // stdout and stderr of the child are appended to output_path (or dropped
  // when empty). Throws util::StartupError when exec fails.
  static ChildProcess Spawn(const std::vector<std::string>& argv, const std::string& output_path);

  pid_t Pid() const {
    return pid_;
  }

  // Non-blocking; reaps the child once it has exited.
  bool Running();

  // Exit status once reaped.
  const std::optional<ExitStatus>& Exit() const {
    return exit_;
  }

  bool Signal(int signal);

  // True when the child exited within timeout.
  bool WaitFor(std::chrono::milliseconds timeout);

  // SIGTERM, bounded wait, SIGKILL.
  void Terminate(std::chrono::milliseconds grace);

 private:
  explicit ChildProcess(pid_t pid) : pid_(pid) {
  }

  void Reset();

  pid_t                     pid_ = 0;
  std::optional<ExitStatus> exit_;
};

} // namespace hosting::proxy
