#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "fake_web_proxy.hpp"
#include "internal/util/time.hpp"

namespace {

using hosting::config::ConfigLoader;
using namespace std::chrono_literals;

std::string WriteConfig(const std::string& name, const std::string& text) {
  const auto path = hosting::testing::FreshDirectory("config_loader") / name;
  std::ofstream out(path);
  out << text;
  return path.string();
}

void TestLoadsYamlWithDurations() {
  const auto path = WriteConfig("full.yaml", R"(
server:
  bind_address: "0.0.0.0:9000"
logging:
  level: debug
proxy:
  executable: /usr/sbin/nginx
  http_port: 8080
  readiness_timeout: 2.5s
  start_attempts: 4
  health_probe_address: "127.0.0.1:8080"
redirect:
  ttl: 60s
  shards: 8
)");

  const auto config = ConfigLoader::LoadFromYaml(path);
  assert(config.server().bind_address() == "0.0.0.0:9000");
  assert(config.logging().level() == "debug");
  assert(config.proxy().executable() == "/usr/sbin/nginx");
  assert(config.proxy().http_port() == 8080);
  assert(hosting::util::FromProto(config.proxy().readiness_timeout()) == 2500ms);
  assert(config.proxy().start_attempts() == 4);
  assert(config.proxy().health_probe_address() == "127.0.0.1:8080");
  assert(hosting::util::FromProto(config.redirect().ttl()) == 60s);
  assert(config.redirect().shards() == 8);

  // untouched fields still get defaults
  assert(config.proxy().https_port() == 443);
  assert(config.redirect().zone_name() == "dynredirmap");
}

void TestEmptyFileMeansDefaults() {
  const auto config   = ConfigLoader::LoadFromYaml(WriteConfig("empty.yaml", ""));
  const auto defaults = ConfigLoader::Defaults();

  assert(config.server().bind_address() == defaults.server().bind_address());
  assert(config.proxy().executable() == "nginx");
  assert(config.proxy().pid_path() == config.proxy().temp_root() + "/nginx.pid");
  assert(hosting::util::FromProto(config.redirect().ttl()) == 120s);
  assert(hosting::util::FromProto(config.proxy().retry_backoff()) == 250ms);
  assert(config.proxy().rapid_restart_limit() == 5);
}

void TestHealthProbeDefaultsToHttpListener() {
  const auto defaults = ConfigLoader::Defaults();
  assert(defaults.proxy().health_probe_address() == "[::1]:80");

  const auto ipv4 = ConfigLoader::LoadFromYaml(WriteConfig("probe_ipv4.yaml", R"(
proxy:
  listen_address: "0.0.0.0"
  http_port: 8080
)"));
  assert(ipv4.proxy().health_probe_address() == "127.0.0.1:8080");

  const auto bound = ConfigLoader::LoadFromYaml(WriteConfig("probe_bound.yaml", R"(
proxy:
  listen_address: "10.0.0.5"
)"));
  assert(bound.proxy().health_probe_address() == "10.0.0.5:80");
}

void TestObservabilityDefaultsAndOverrides() {
  const auto defaults = ConfigLoader::Defaults();
  assert(!defaults.observability().metrics_enabled());
  assert(!defaults.observability().tracing_enabled());
  assert(defaults.observability().metrics().request_metrics_enabled());
  assert(defaults.observability().metrics().route_labels_enabled());
  assert(defaults.observability().metrics().proxy_metrics_enabled());
  assert(!defaults.logging().include_trace_context());

  const auto config = ConfigLoader::LoadFromYaml(WriteConfig("observability.yaml", R"(
logging:
  include_trace_context: true
observability:
  metrics_enabled: true
  otlp_endpoint: "collector:4317"
  metrics:
    route_labels_enabled: false
)"));
  assert(config.logging().include_trace_context());
  assert(config.observability().metrics_enabled());
  assert(config.observability().otlp_endpoint() == "collector:4317");
  assert(!config.observability().metrics().route_labels_enabled());
  assert(config.observability().metrics().request_metrics_enabled());
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml(WriteConfig("unknown.yaml", "proxy:\n  executabel: nginx\n"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/hosting-controller.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsYamlWithDurations();
  TestEmptyFileMeansDefaults();
  TestHealthProbeDefaultsToHttpListener();
  TestObservabilityDefaultsAndOverrides();
  TestUnknownFieldsAreRejected();
  TestMissingFileFails();

  std::cout << "hosting_controller_unit_config_loader: pass\n";
  return 0;
}
