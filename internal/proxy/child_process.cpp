#include "child_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

namespace hosting::proxy {

namespace {

constexpr auto kPollStep = std::chrono::milliseconds(20);

ExitStatus FromWaitStatus(int status) {
  ExitStatus out;
  if (WIFEXITED(status)) {
    out.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.signal = WTERMSIG(status);
  }
  return out;
}

std::vector<char*> MakeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    out.push_back(const_cast<char*>(arg.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/*
  fork + execvp with stdout/stderr on out_fd.

  A CLOEXEC pipe reports exec failure back to the parent: it reads EOF when
  exec succeeded, otherwise the child's errno. Returns the pid, or -1 with
  exec_errno set (the failed child is already reaped).
*/
pid_t ForkExec(const std::vector<std::string>& argv, int out_fd, int& exec_errno) {
  exec_errno = 0;
  if (argv.empty()) {
    exec_errno = EINVAL;
    return -1;
  }

  auto args = MakeArgv(argv);

  int report[2];
  if (::pipe2(report, O_CLOEXEC) != 0) {
    exec_errno = errno;
    return -1;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    exec_errno = errno;
    ::close(report[0]);
    ::close(report[1]);
    return -1;
  }

  if (pid == 0) {
    ::close(report[0]);
    if (out_fd >= 0) {
      ::dup2(out_fd, STDOUT_FILENO);
      ::dup2(out_fd, STDERR_FILENO);
    }
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    ::execvp(args[0], args.data());
    const int err      = errno;
    const auto written = ::write(report[1], &err, sizeof(err));
    (void)written;
    ::_exit(127);
  }

  ::close(report[1]);
  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(report[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(report[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    exec_errno = child_errno;
    return -1;
  }
  return pid;
}

std::string LaunchFailure(const std::vector<std::string>& argv, int err) {
  return "cannot run " + (argv.empty() ? std::string("<empty>") : argv.front()) + ": " + std::strerror(err);
}

} // namespace

std::string ExitStatus::Describe() const {
  if (signal != 0) {
    return std::string("killed by signal ") + std::to_string(signal) + " (" + ::strsignal(signal) + ")";
  }
  return "exit code " + std::to_string(code);
}

CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  int output[2];
  if (::pipe2(output, O_CLOEXEC) != 0) {
    throw util::UpstreamError(LaunchFailure(argv, errno));
  }

  int        exec_errno = 0;
  const auto pid        = ForkExec(argv, output[1], exec_errno);
  ::close(output[1]);
  if (pid < 0) {
    ::close(output[0]);
    throw util::UpstreamError(LaunchFailure(argv, exec_errno));
  }

  CommandResult result;
  const auto    deadline = std::chrono::steady_clock::now() + timeout;
  bool          killed   = false;
  char          buffer[4096];

  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      ::kill(pid, SIGKILL);
      killed = true;
      break;
    }

    pollfd pfd{output[0], POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      killed = true;
      break;
    }
    if (ready == 0) continue;

    const auto n = ::read(output[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    result.output.append(buffer, static_cast<std::size_t>(n));
  }
  ::close(output[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  result.status = FromWaitStatus(status);

  if (killed) {
    throw util::UpstreamError(argv.front() + " did not finish within " + std::to_string(timeout.count()) + "ms");
  }
  return result;
}

ChildProcess::~ChildProcess() {
  Reset();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_), exit_(std::move(other.exit_)) {
  other.pid_ = 0;
  other.exit_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    Reset();
    pid_  = other.pid_;
    exit_ = std::move(other.exit_);
    other.pid_ = 0;
    other.exit_.reset();
  }
  return *this;
}

void ChildProcess::Reset() {
  if (pid_ > 0 && !exit_) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  pid_ = 0;
  exit_.reset();
}

ChildProcess ChildProcess::Spawn(const std::vector<std::string>& argv, const std::string& output_path) {
  const char* target = output_path.empty() ? "/dev/null" : output_path.c_str();
  int         out_fd = ::open(target, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (out_fd < 0) {
    throw util::StartupError("cannot open " + std::string(target) + ": " + std::strerror(errno));
  }

  int        exec_errno = 0;
  const auto pid        = ForkExec(argv, out_fd, exec_errno);
  CloseFd(out_fd);
  if (pid < 0) {
    throw util::StartupError(LaunchFailure(argv, exec_errno));
  }
  return ChildProcess(pid);
}

bool ChildProcess::Running() {
  if (pid_ <= 0 || exit_) {
    return false;
  }

  int         status = 0;
  const pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
  if (reaped == 0) {
    return true;
  }
  if (reaped == pid_) {
    exit_ = FromWaitStatus(status);
    return false;
  }
  if (errno == EINTR) {
    return true;
  }
  // ECHILD: reaped elsewhere, the status is lost
  exit_ = ExitStatus{};
  return false;
}

bool ChildProcess::Signal(int signal) {
  if (!Running()) {
    return false;
  }
  return ::kill(pid_, signal) == 0;
}

bool ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (Running()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kPollStep);
  }
  return true;
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
  if (!Signal(SIGTERM)) {
    return;
  }
  if (WaitFor(grace)) {
    return;
  }
  ::kill(pid_, SIGKILL);
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  exit_ = FromWaitStatus(status);
}

} // namespace hosting::proxy
