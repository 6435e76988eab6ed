#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "hosting/v1/provisioning.pb.h"

namespace hosting::runtime::config {
class RuntimeConfig;
}

namespace hosting::confgen {

// Provisioning session id -> record. Ordered so generation is deterministic.
using SessionMap = std::map<std::string, hosting::v1::ContentHostingConfiguration>;

// Certificate id -> path of the PEM file (certificate chain + key).
using CertificatePaths = std::map<std::string, std::string>;

struct GeneratorSettings {
  std::string listen_address = "[::]";
  uint32_t    http_port      = 80;
  uint32_t    https_port     = 443;

  std::string error_log;
  std::string access_log;
  std::string pid_path;
  std::string cache_dir;
  std::string temp_root;

  std::string          redirect_zone_name = "dynredirmap";
  std::string          redirect_zone_size = "10m";
  std::chrono::seconds redirect_ttl{120};

  static GeneratorSettings FromConfig(const hosting::runtime::config::RuntimeConfig& config);
};

/*
  Renders the complete proxy configuration for a set of provisioning records.

  Pure function of its inputs: the same records and certificate paths always
  produce byte-identical text. Throws util::ValidationError for records the
  proxy cannot express (unknown ingest, missing certificate, bad rewrite rule,
  the same path prefix claimed twice).
*/
class ConfigGenerator {
 public:
  explicit ConfigGenerator(GeneratorSettings settings);

  std::string Generate(const SessionMap& sessions, const CertificatePaths& certificates) const;

  const GeneratorSettings& Settings() const {
    return settings_;
  }

 private:
  GeneratorSettings settings_;
};

} // namespace hosting::confgen
