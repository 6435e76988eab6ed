#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace hosting::config {

using hosting::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

namespace {

void DefaultString(std::string* field, const std::string& value) {
  if (field->empty()) {
    *field = value;
  }
}

void DefaultDuration(google::protobuf::Duration* field, std::chrono::milliseconds value) {
  if (field->seconds() == 0 && field->nanos() == 0) {
    *field = util::ToProto(value);
  }
}

// The health probe connects to the plain HTTP listener; wildcard listen
// addresses are probed on loopback of the same family.
std::string ProbeAddressFor(const std::string& listen_address, std::uint32_t port) {
  std::string host = listen_address;
  if (host.empty() || host == "*" || host == "0.0.0.0") {
    host = "127.0.0.1";
  } else if (host == "[::]") {
    host = "[::1]";
  }
  return host + ":" + std::to_string(port);
}

} // namespace

// ------------------------------------------------------------
// Defaults (mirror the application server's stock configuration)
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  using namespace std::chrono_literals;

  DefaultString(config->mutable_server()->mutable_bind_address(), "127.0.0.1:7777");
  DefaultString(config->mutable_logging()->mutable_level(), "info");

  auto* proxy = config->mutable_proxy();
  DefaultString(proxy->mutable_executable(), "nginx");
  DefaultString(proxy->mutable_config_dir(), "/tmp/hosting-controller");
  DefaultString(proxy->mutable_listen_address(), "[::]");
  if (proxy->http_port() == 0) proxy->set_http_port(80);
  if (proxy->https_port() == 0) proxy->set_https_port(443);
  DefaultString(proxy->mutable_health_probe_address(), ProbeAddressFor(proxy->listen_address(), proxy->http_port()));
  DefaultString(proxy->mutable_error_log(), "/var/log/hosting-controller/proxy-error.log");
  DefaultString(proxy->mutable_access_log(), "/var/log/hosting-controller/proxy-access.log");
  DefaultString(proxy->mutable_temp_root(), "/var/cache/hosting-controller");
  DefaultString(proxy->mutable_pid_path(), proxy->temp_root() + "/nginx.pid");
  DefaultString(proxy->mutable_cache_dir(), proxy->temp_root() + "/cache");
  DefaultString(proxy->mutable_certificates_dir(), proxy->temp_root() + "/certificates");
  DefaultDuration(proxy->mutable_readiness_timeout(), 5s);
  DefaultDuration(proxy->mutable_shutdown_timeout(), 10s);
  if (proxy->start_attempts() == 0) proxy->set_start_attempts(3);
  DefaultDuration(proxy->mutable_retry_backoff(), 250ms);
  DefaultDuration(proxy->mutable_watchdog_interval(), 1s);
  if (proxy->rapid_restart_limit() == 0) proxy->set_rapid_restart_limit(5);
  DefaultDuration(proxy->mutable_rapid_restart_window(), 10s);

  auto* redirect = config->mutable_redirect();
  DefaultString(redirect->mutable_zone_name(), "dynredirmap");
  DefaultString(redirect->mutable_zone_size(), "10m");
  DefaultDuration(redirect->mutable_ttl(), 120s);
  if (redirect->shards() == 0) redirect->set_shards(16);
  DefaultDuration(redirect->mutable_sweep_interval(), 30s);

  auto* metrics = config->mutable_observability()->mutable_metrics();
  if (!metrics->has_request_metrics_enabled()) metrics->set_request_metrics_enabled(true);
  if (!metrics->has_request_latency_histograms_enabled()) metrics->set_request_latency_histograms_enabled(true);
  if (!metrics->has_route_labels_enabled()) metrics->set_route_labels_enabled(true);
  if (!metrics->has_proxy_metrics_enabled()) metrics->set_proxy_metrics_enabled(true);
  if (metrics->collection_interval_ms() == 0) metrics->set_collection_interval_ms(10000);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid "all defaults" configuration
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace hosting::config
