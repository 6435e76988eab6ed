#include "internal/proxy/nginx_proxy.hpp"

#include <signal.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include "fake_web_proxy.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using hosting::proxy::ChildProcess;
using hosting::proxy::NginxProxy;
using hosting::proxy::NginxSettings;
using hosting::proxy::RunCommand;
using namespace std::chrono_literals;

// Stand-in for the nginx binary: prints a help text with the given flags,
// checks configs with -t (anything containing "reject" fails) and otherwise
// runs in the foreground counting SIGHUPs.
std::string WriteFakeNginx(const fs::path& dir, const std::string& flags) {
  const auto path = dir / "nginx";
  std::ofstream out(path);
  out << "#!/bin/sh\n"
      << "config=''\n"
      << "check=0\n"
      << "while [ $# -gt 0 ]; do\n"
      << "  case \"$1\" in\n"
      << "    -h) printf 'Options:\\n  -?,-h         : this help\\n" << flags << "'; exit 0 ;;\n"
      << "    -t) check=1 ;;\n"
      << "    -c) shift; config=\"$1\" ;;\n"
      << "    -e|-g) shift ;;\n"
      << "  esac\n"
      << "  shift\n"
      << "done\n"
      << "if [ $check -eq 1 ]; then\n"
      << "  if grep -q reject \"$config\"; then echo \"emerg: bad config\"; exit 1; fi\n"
      << "  echo \"syntax is ok\"; exit 0\n"
      << "fi\n"
      << "trap 'echo hup >> \"" << (dir / "reloads").string() << "\"' HUP\n"
      << "while :; do sleep 0.05; done\n";
  out.close();
  fs::permissions(path, fs::perms::owner_all);
  return path.string();
}

const std::string kAllFlags =
    "  -e filename   : set error log file\\n"
    "  -c filename   : set configuration file\\n"
    "  -g directives : set global directives\\n";

std::string WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << text;
  return path.string();
}

std::string CacheFile(const std::string& key) {
  // binary header nginx writes ahead of the key
  return std::string("\x05\0\0\0\0\0\0\0\x10\x20", 10) + "\nKEY: " + key + "\nHTTP/1.1 200 OK\r\n\r\nbody";
}

int CountLines(const fs::path& path) {
  std::ifstream in(path);
  int           lines = 0;
  for (std::string line; std::getline(in, line);) {
    ++lines;
  }
  return lines;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestRunCommandCapturesOutputAndStatus() {
  const auto result = RunCommand({"sh", "-c", "echo out; echo err >&2; exit 3"}, 5s);
  assert(!result.status.Success());
  assert(result.status.code == 3);
  assert(result.output.find("out") != std::string::npos);
  assert(result.output.find("err") != std::string::npos);

  assert(RunCommand({"true"}, 5s).status.Success());
  assert(Throws<hosting::util::UpstreamError>([] { RunCommand({"/nonexistent/binary"}, 5s); }));
  assert(Throws<hosting::util::UpstreamError>([] { RunCommand({"sleep", "5"}, 100ms); }));
}

void TestChildProcessLifecycle() {
  auto child = ChildProcess::Spawn({"sleep", "5"}, "");
  assert(child.Pid() > 0);
  assert(child.Running());

  child.Terminate(1s);
  assert(!child.Running());
  assert(child.Exit());
  assert(child.Exit()->signal == SIGTERM);

  auto quick = ChildProcess::Spawn({"sh", "-c", "exit 7"}, "");
  assert(quick.WaitFor(2s));
  assert(quick.Exit()->code == 7);
  assert(!quick.Signal(SIGHUP));

  assert(Throws<hosting::util::StartupError>([] { ChildProcess::Spawn({"/nonexistent/binary"}, ""); }));
}

void TestCommandLineFollowsProbedFlags() {
  const auto dir = hosting::testing::FreshDirectory("nginx_flags");

  NginxSettings settings;
  settings.executable = WriteFakeNginx(dir, kAllFlags);
  settings.error_log  = (dir / "error.log").string();
  NginxProxy full(settings);
  assert((full.CommandLine("/etc/hc/nginx.conf") ==
          std::vector<std::string>{settings.executable, "-e", settings.error_log, "-c", "/etc/hc/nginx.conf", "-g", "daemon off;"}));

  const auto old_dir = hosting::testing::FreshDirectory("nginx_flags_old");
  settings.executable = WriteFakeNginx(old_dir,
                                       "  -c filename   : set configuration file\\n"
                                       "  -g directives : set global directives\\n");
  NginxProxy old(settings);
  assert((old.CommandLine("/etc/hc/nginx.conf") ==
          std::vector<std::string>{settings.executable, "-c", "/etc/hc/nginx.conf", "-g", "daemon off;"}));

  const auto broken_dir = hosting::testing::FreshDirectory("nginx_flags_broken");
  settings.executable    = WriteFakeNginx(broken_dir, "  -c filename   : set configuration file\\n");
  NginxProxy broken(settings);
  assert(Throws<hosting::util::StartupError>([&] { broken.CommandLine("/etc/hc/nginx.conf"); }));
}

void TestValidateRunsSyntaxCheck() {
  const auto dir = hosting::testing::FreshDirectory("nginx_validate");

  NginxSettings settings;
  settings.executable = WriteFakeNginx(dir, kAllFlags);
  NginxProxy proxy(settings);

  proxy.Validate(WriteFile(dir / "good.conf", "events {}\n"));
  assert(Throws<hosting::util::ConfigInvalid>([&] { proxy.Validate(WriteFile(dir / "bad.conf", "reject me\n")); }));

  settings.executable = (dir / "missing").string();
  NginxProxy missing(settings);
  assert(Throws<hosting::util::ConfigInvalid>([&] { missing.Validate((dir / "good.conf").string()); }));
}

void TestStartReloadStop() {
  const auto dir = hosting::testing::FreshDirectory("nginx_run");

  NginxSettings settings;
  settings.executable = WriteFakeNginx(dir, kAllFlags);
  settings.error_log  = (dir / "logs" / "error.log").string();
  settings.directories = {(dir / "logs").string(), (dir / "proxy-tmp").string()};
  NginxProxy proxy(settings);

  const auto config = WriteFile(dir / "nginx.conf", "events {}\n");
  proxy.Start(config);
  assert(fs::exists(dir / "proxy-tmp"));
  assert(proxy.WaitReady(2s));
  assert(proxy.Running());
  assert(proxy.HealthCheck());
  assert(proxy.Pid() > 0);
  assert(Throws<hosting::util::StartupError>([&] { proxy.Start(config); }));

  proxy.Reload();
  for (int i = 0; i < 100 && CountLines(dir / "reloads") < 1; ++i) {
    std::this_thread::sleep_for(20ms);
  }
  assert(CountLines(dir / "reloads") == 1);

  proxy.Stop(1s);
  assert(!proxy.Running());
  assert(!proxy.HealthCheck());
  assert(proxy.Pid() == 0);
  assert(Throws<hosting::util::ReloadError>([&] { proxy.Reload(); }));

  // a health probe against a closed port never reports ready
  settings.health_probe_address = "127.0.0.1:1";
  NginxProxy probed(settings);
  probed.Start(config);
  assert(!probed.WaitReady(300ms));
  probed.Stop(1s);
}

void TestCacheKeys() {
  const auto dir = hosting::testing::FreshDirectory("nginx_cache_keys");

  std::string session;
  std::string path;
  assert(hosting::proxy::ParseCacheKey("S1:u=/m4d/S1/a.m4s", &session, &path));
  assert(session == "S1");
  assert(path == "/m4d/S1/a.m4s");
  assert(!hosting::proxy::ParseCacheKey("http://origin/a.m4s", &session, &path));

  assert(hosting::proxy::ReadCacheKey(WriteFile(dir / "a", CacheFile("S1:u=/x"))) == std::optional<std::string>("S1:u=/x"));
  assert(!hosting::proxy::ReadCacheKey(WriteFile(dir / "b", "no key here")));
  assert(!hosting::proxy::ReadCacheKey((dir / "missing").string()));

  // the key must sit in the leading header
  assert(!hosting::proxy::ReadCacheKey(WriteFile(dir / "c", std::string(5000, 'x') + "\nKEY: S1:u=/x\n")));
}

void TestPurgeRemovesMatchingEntries() {
  const auto dir   = hosting::testing::FreshDirectory("nginx_purge");
  const auto cache = dir / "cache";

  const auto video = WriteFile(cache / "a" / "1f" / "0001", CacheFile("S1:u=/m4d/S1/video/seg-1.m4s"));
  const auto audio = WriteFile(cache / "b" / "2e" / "0002", CacheFile("S1:u=/m4d/S1/audio/seg-1.m4s"));
  const auto other = WriteFile(cache / "c" / "3d" / "0003", CacheFile("S2:u=/m4d/S2/video/seg-1.m4s"));
  WriteFile(cache / "d" / "4c" / "0004", "not a cache file");

  NginxSettings settings;
  settings.cache_dir = cache.string();
  NginxProxy proxy(settings);

  hosting::proxy::PurgeRequest by_pattern{"S1", std::regex("/m4d/S1/video/")};
  assert(proxy.Purge(by_pattern) == 1);
  assert(!fs::exists(video));
  assert(fs::exists(audio));

  // anchored at the start of the path
  hosting::proxy::PurgeRequest unanchored{"S1", std::regex("audio/")};
  assert(proxy.Purge(unanchored) == 0);

  assert(proxy.Purge(hosting::proxy::PurgeRequest{"S1", std::nullopt}) == 1);
  assert(!fs::exists(audio));
  assert(fs::exists(other));

  NginxSettings no_cache;
  NginxProxy    uncached(no_cache);
  assert(uncached.Purge(hosting::proxy::PurgeRequest{"S1", std::nullopt}) == 0);
}

} // namespace

int main() {
  TestRunCommandCapturesOutputAndStatus();
  TestChildProcessLifecycle();
  TestCommandLineFollowsProbedFlags();
  TestValidateRunsSyntaxCheck();
  TestStartReloadStop();
  TestCacheKeys();
  TestPurgeRemovesMatchingEntries();

  std::cout << "hosting_controller_unit_nginx_proxy: pass\n";
  return 0;
}
