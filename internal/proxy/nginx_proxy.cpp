#include "nginx_proxy.hpp"

#include <netdb.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <thread>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hosting::proxy {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCacheHeaderBytes = 4096;
constexpr auto        kReadyPoll        = std::chrono::milliseconds(50);

// Without a probe address a process that survives this long is ready.
constexpr auto kSettleTime = std::chrono::milliseconds(250);

bool SplitHostPort(const std::string& address, std::string* host, std::string* port) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 == address.size()) {
    return false;
  }
  *host = address.substr(0, colon);
  *port = address.substr(colon + 1);
  if (host->size() >= 2 && host->front() == '[' && host->back() == ']') {
    *host = host->substr(1, host->size() - 2);
  }
  return !host->empty();
}

bool ConnectWithTimeout(const addrinfo* ai, std::chrono::milliseconds timeout) {
  const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
  if (fd < 0) {
    return false;
  }

  bool connected = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
  if (!connected && errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
      int       err = 0;
      socklen_t len = sizeof(err);
      connected     = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
    }
  }
  ::close(fd);
  return connected;
}

} // namespace

NginxSettings NginxSettings::FromConfig(const hosting::runtime::config::ProxyConfig& config) {
  NginxSettings settings;
  settings.executable           = config.executable();
  settings.error_log            = config.error_log();
  settings.cache_dir            = config.cache_dir();
  settings.health_probe_address = config.health_probe_address();

  for (const auto& log : {config.error_log(), config.access_log(), config.pid_path()}) {
    if (!log.empty()) {
      settings.directories.push_back(fs::path(log).parent_path().string());
    }
  }
  for (const auto& dir : {config.cache_dir(), config.certificates_dir()}) {
    if (!dir.empty()) {
      settings.directories.push_back(dir);
    }
  }
  if (!config.temp_root().empty()) {
    for (const char* name : {"client_body", "proxy", "fastcgi", "uwsgi", "scgi"}) {
      settings.directories.push_back(config.temp_root() + "/" + name + "-tmp");
    }
  }
  return settings;
}

bool ParseCacheKey(const std::string& key, std::string* session_id, std::string* path) {
  const auto split = key.find(":u=");
  if (split == std::string::npos) {
    return false;
  }
  *session_id = key.substr(0, split);
  *path       = key.substr(split + 3);
  return true;
}

std::optional<std::string> ReadCacheKey(const std::string& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }

  std::string header(kCacheHeaderBytes, '\0');
  in.read(header.data(), static_cast<std::streamsize>(header.size()));
  header.resize(static_cast<std::size_t>(in.gcount()));

  static const std::string kMarker = "\nKEY: ";
  const auto               start   = header.find(kMarker);
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const auto from = start + kMarker.size();
  const auto end  = header.find('\n', from);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return header.substr(from, end - from);
}

NginxProxy::NginxProxy(NginxSettings settings) : settings_(std::move(settings)) {
}

NginxProxy::~NginxProxy() {
  std::lock_guard lock(mutex_);
  child_.Terminate(std::chrono::milliseconds(1000));
}

const std::set<std::string>& NginxProxy::SupportedFlags() {
  if (supported_flags_) {
    return *supported_flags_;
  }

  std::set<std::string> flags;
  const auto            result = RunCommand({settings_.executable, "-h"}, settings_.command_timeout);
  if (result.status.Success()) {
    std::size_t pos = 0;
    while (pos < result.output.size()) {
      auto end = result.output.find('\n', pos);
      if (end == std::string::npos) end = result.output.size();

      auto line  = result.output.substr(pos, end - pos);
      auto first = line.find_first_not_of(" \t");
      if (first != std::string::npos && line[first] == '-' && first + 2 < line.size() && (line[first + 2] == ' ' || line[first + 2] == '\t')) {
        flags.insert(line.substr(first, 2));
      }
      pos = end + 1;
    }
  }

  HOSTING_LOG_DEBUG("Probed nginx flags", {observability::StringField("executable", settings_.executable),
                                           observability::IntField("flags", static_cast<std::int64_t>(flags.size()))});
  supported_flags_ = std::move(flags);
  return *supported_flags_;
}

std::vector<std::string> NginxProxy::CommandLine(const std::string& config_path) {
  const auto& flags = SupportedFlags();

  for (const char* required : {"-c", "-g"}) {
    if (flags.count(required) == 0) {
      throw util::StartupError(settings_.executable + " does not accept " + required);
    }
  }

  std::vector<std::string> args{settings_.executable};
  if (flags.count("-e") != 0 && !settings_.error_log.empty()) {
    args.insert(args.end(), {"-e", settings_.error_log});
  }
  args.insert(args.end(), {"-c", config_path, "-g", "daemon off;"});
  return args;
}

void NginxProxy::EnsureDirectories() const {
  for (const auto& dir : settings_.directories) {
    if (dir.empty()) continue;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      throw util::StartupError("cannot create " + dir + ": " + ec.message());
    }
  }
}

void NginxProxy::Validate(const std::string& config_path) {
  CommandResult result;
  try {
    std::vector<std::string> args{settings_.executable};
    {
      std::lock_guard lock(mutex_);
      if (SupportedFlags().count("-e") != 0 && !settings_.error_log.empty()) {
        args.insert(args.end(), {"-e", settings_.error_log});
      }
    }
    args.insert(args.end(), {"-t", "-c", config_path});
    result = RunCommand(args, settings_.command_timeout);
  } catch (const util::UpstreamError& e) {
    throw util::ConfigInvalid(std::string("configuration check did not run: ") + e.what());
  }

  if (!result.status.Success()) {
    throw util::ConfigInvalid(config_path + " rejected (" + result.status.Describe() + "): " + result.output);
  }
}

void NginxProxy::Start(const std::string& config_path) {
  std::lock_guard lock(mutex_);
  if (child_.Running()) {
    throw util::StartupError("nginx already running with pid " + std::to_string(child_.Pid()));
  }

  EnsureDirectories();
  std::vector<std::string> args;
  try {
    args = CommandLine(config_path);
  } catch (const util::UpstreamError& e) {
    throw util::StartupError(e.what());
  }

  child_ = ChildProcess::Spawn(args, settings_.error_log);
  HOSTING_LOG_INFO("Started nginx", {observability::IntField("pid", child_.Pid()), observability::StringField("config", config_path)});
}

bool NginxProxy::WaitReady(std::chrono::milliseconds timeout) {
  const auto deadline = util::Now() + timeout;
  const auto settled  = util::Now() + std::min<std::chrono::milliseconds>(timeout, kSettleTime);

  for (;;) {
    {
      std::lock_guard lock(mutex_);
      if (!child_.Running()) {
        if (child_.Exit()) {
          HOSTING_LOG_WARN("nginx exited before becoming ready", {observability::StringField("status", child_.Exit()->Describe())});
        }
        return false;
      }
    }

    const auto now = util::Now();
    if (settings_.health_probe_address.empty()) {
      if (now >= settled) return true;
    } else if (ProbeConnect()) {
      return true;
    }

    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kReadyPoll);
  }
}

void NginxProxy::Reload() {
  std::lock_guard lock(mutex_);
  if (!child_.Signal(SIGHUP)) {
    throw util::ReloadError("nginx is not running");
  }
}

void NginxProxy::Stop(std::chrono::milliseconds timeout) {
  std::lock_guard lock(mutex_);
  if (child_.Pid() == 0) {
    return;
  }
  const auto pid = child_.Pid();
  child_.Terminate(timeout);
  if (child_.Exit()) {
    HOSTING_LOG_INFO("Stopped nginx", {observability::IntField("pid", pid), observability::StringField("status", child_.Exit()->Describe())});
  }
  child_ = ChildProcess{};
}

bool NginxProxy::Running() {
  std::lock_guard lock(mutex_);
  return child_.Running();
}

bool NginxProxy::HealthCheck() {
  if (!Running()) {
    return false;
  }
  return settings_.health_probe_address.empty() || ProbeConnect();
}

int NginxProxy::Pid() const {
  std::lock_guard lock(mutex_);
  return child_.Exit() ? 0 : static_cast<int>(child_.Pid());
}

bool NginxProxy::ProbeConnect() const {
  std::string host;
  std::string port;
  if (!SplitHostPort(settings_.health_probe_address, &host, &port)) {
    return false;
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  if (::getaddrinfo(host.c_str(), port.c_str(), &hints, &result) != 0) {
    return false;
  }

  bool connected = false;
  for (auto* ai = result; ai != nullptr && !connected; ai = ai->ai_next) {
    connected = ConnectWithTimeout(ai, settings_.probe_timeout);
  }
  ::freeaddrinfo(result);
  return connected;
}

std::size_t NginxProxy::Purge(const PurgeRequest& request) {
  if (settings_.cache_dir.empty()) {
    return 0;
  }

  std::error_code ec;
  if (!fs::exists(settings_.cache_dir, ec)) {
    return 0;
  }

  std::vector<fs::path> victims;
  fs::recursive_directory_iterator it(settings_.cache_dir, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;

    auto key = ReadCacheKey(it->path().string());
    if (!key) continue;

    std::string session_id;
    std::string path;
    if (!ParseCacheKey(*key, &session_id, &path) || session_id != request.session_id) continue;
    if (request.path_pattern && !std::regex_search(path, *request.path_pattern, std::regex_constants::match_continuous)) continue;

    victims.push_back(it->path());
  }
  if (ec) {
    throw util::UpstreamError("cannot scan cache " + settings_.cache_dir + ": " + ec.message());
  }

  std::size_t purged = 0;
  for (const auto& victim : victims) {
    if (fs::remove(victim, ec)) {
      ++purged;
    } else if (ec) {
      throw util::UpstreamError("cannot remove cache entry " + victim.string() + ": " + ec.message());
    }
  }

  if (purged > 0) {
    std::lock_guard lock(mutex_);
    if (!child_.Signal(SIGHUP)) {
      HOSTING_LOG_DEBUG("Purged cache without a running nginx", {observability::StringField("session", request.session_id)});
    }
  }
  return purged;
}

} // namespace hosting::proxy
