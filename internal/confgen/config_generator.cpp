#include "config_generator.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <vector>

#include "config/config.pb.h"
#include "directives.hpp"
#include "hosting/v1.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hosting::confgen {

using util::ValidationError;

namespace {

constexpr const char* kCacheZone = "cacheone";

struct Location {
  std::string              session_id;
  std::string              prefix;
  std::vector<std::string> rewrites;
  std::string              proxy_pass;  // ingest backed
  std::string              alias;       // static content
};

// One server block per (listener, certificate).
struct ServerKey {
  bool        tls = false;
  std::string certificate_id;

  bool operator<(const ServerKey& other) const {
    if (tls != other.tls) {
      return !tls;
    }
    return certificate_id < other.certificate_id;
  }
};

struct Server {
  std::set<std::string> names;
  std::vector<Location> locations;
};

const hosting::v1::IngestConfiguration& FindIngest(const std::string& session_id, const hosting::v1::ContentHostingConfiguration& chc, const std::string& ingest_id) {
  for (const auto& ingest : chc.ingest_configurations()) {
    if (ingest.id() == ingest_id) {
      return ingest;
    }
  }
  throw ValidationError("session " + session_id + ": distribution references unknown ingest " + ingest_id);
}

Location BuildLocation(const std::string& session_id, const hosting::v1::ContentHostingConfiguration& chc, const hosting::v1::DistributionConfiguration& dc) {
  Location location;
  location.session_id = session_id;
  location.prefix     = NormalizePathPrefix(dc.path_prefix());

  for (const auto& rule : dc.path_rewrite_rules()) {
    auto [regex, replace] = TransformRewriteRule(rule.request_pattern(), rule.mapped_path());
    location.rewrites.push_back("rewrite \"" + regex + "\" \"" + replace + "\" break;");
  }

  switch (dc.source_case()) {
    case hosting::v1::DistributionConfiguration::kIngestId: {
      const auto& ingest = FindIngest(session_id, chc, dc.ingest_id());
      if (!ingest.pull() || ingest.protocol() != hosting::v1::kHttpPullIngestProtocol) {
        throw ValidationError("session " + session_id + ": only pull ingest with " + hosting::v1::kHttpPullIngestProtocol + " is supported");
      }
      location.proxy_pass = ParseOrigin(ingest.base_url()).Url();
      break;
    }
    case hosting::v1::DistributionConfiguration::kDocumentRoot: {
      auto root = dc.document_root();
      if (root.empty() || root.front() != '/' || !IsSafeToken(root)) {
        throw ValidationError("session " + session_id + ": document root must be an absolute path: " + root);
      }
      if (root.back() != '/') {
        root.push_back('/');
      }
      location.alias = root;
      break;
    }
    default:
      throw ValidationError("session " + session_id + ": distribution " + location.prefix + " has no content source");
  }
  return location;
}

void WriteLocation(std::ostringstream& out, const Location& location, bool caching) {
  out << "        location " << location.prefix << " {\n";
  for (const auto& rewrite : location.rewrites) {
    out << "            " << rewrite << "\n";
  }
  if (!location.proxy_pass.empty()) {
    if (caching) {
      out << "            proxy_cache " << kCacheZone << ";\n";
    }
    out << "            proxy_cache_key \"" << location.session_id << ":u=$uri\";\n";
    out << "            proxy_pass " << location.proxy_pass << ";\n";
  } else {
    out << "            alias " << location.alias << ";\n";
  }
  out << "        }\n";
}

} // namespace

GeneratorSettings GeneratorSettings::FromConfig(const hosting::runtime::config::RuntimeConfig& config) {
  const auto& proxy    = config.proxy();
  const auto& redirect = config.redirect();

  GeneratorSettings settings;
  settings.listen_address     = proxy.listen_address();
  settings.http_port          = proxy.http_port();
  settings.https_port         = proxy.https_port();
  settings.error_log          = proxy.error_log();
  settings.access_log         = proxy.access_log();
  settings.pid_path           = proxy.pid_path();
  settings.cache_dir          = proxy.cache_dir();
  settings.temp_root          = proxy.temp_root();
  settings.redirect_zone_name = redirect.zone_name();
  settings.redirect_zone_size = redirect.zone_size();
  settings.redirect_ttl       = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(redirect.ttl()));
  return settings;
}

ConfigGenerator::ConfigGenerator(GeneratorSettings settings) : settings_(std::move(settings)) {
}

std::string ConfigGenerator::Generate(const SessionMap& sessions, const CertificatePaths& certificates) const {
  std::map<ServerKey, Server>        servers;
  std::map<std::string, std::string> prefix_owner;

  for (const auto& [session_id, chc] : sessions) {
    if (!IsSafeToken(session_id) || session_id.find(':') != std::string::npos) {
      throw ValidationError("invalid provisioning session id: " + session_id);
    }
    for (const auto& dc : chc.distribution_configurations()) {
      auto location = BuildLocation(session_id, chc, dc);

      auto [owner, inserted] = prefix_owner.emplace(location.prefix, session_id);
      if (!inserted) {
        throw ValidationError("path prefix " + location.prefix + " of session " + session_id + " is already used by session " + owner->second);
      }

      ServerKey key;
      if (!dc.certificate_id().empty()) {
        if (certificates.find(dc.certificate_id()) == certificates.end()) {
          throw ValidationError("session " + session_id + ": unknown certificate " + dc.certificate_id());
        }
        key.tls            = true;
        key.certificate_id = dc.certificate_id();
      }

      auto& server = servers[key];
      for (const auto* name : {&dc.canonical_domain_name(), &dc.domain_name_alias()}) {
        if (name->empty()) {
          continue;
        }
        if (!IsSafeToken(*name) || name->find('/') != std::string::npos) {
          throw ValidationError("session " + session_id + ": invalid domain name: " + *name);
        }
        server.names.insert(*name);
      }
      server.locations.push_back(std::move(location));
    }
  }

  const bool caching = !settings_.cache_dir.empty();

  std::ostringstream out;
  out << "# generated by hosting-controller, do not edit\n";
  out << "worker_processes auto;\n";
  if (!settings_.pid_path.empty()) {
    out << "pid " << settings_.pid_path << ";\n";
  }
  if (!settings_.error_log.empty()) {
    out << "error_log " << settings_.error_log << ";\n";
  }
  out << "\nevents {\n    worker_connections 1024;\n}\n\n";

  out << "http {\n";
  if (!settings_.access_log.empty()) {
    out << "    access_log " << settings_.access_log << ";\n";
  }
  if (!settings_.temp_root.empty()) {
    for (const char* name : {"client_body", "proxy", "fastcgi", "uwsgi", "scgi"}) {
      out << "    " << name << "_temp_path " << settings_.temp_root << "/" << name << "-tmp;\n";
    }
  }
  if (caching) {
    out << "    proxy_cache_path " << settings_.cache_dir << " levels=1:2 use_temp_path=on keys_zone=" << kCacheZone << ":10m;\n";
  }

  out << "\n    map $host $redirect_table_zone {\n";
  out << "        default \"" << settings_.redirect_zone_name << ":" << settings_.redirect_zone_size << "\";\n";
  out << "    }\n";
  out << "    map $host $redirect_table_ttl {\n";
  out << "        default \"" << settings_.redirect_ttl.count() << "\";\n";
  out << "    }\n";

  for (auto& [key, server] : servers) {
    // longest prefix first so the more specific location reads first
    std::sort(server.locations.begin(), server.locations.end(), [](const Location& a, const Location& b) {
      if (a.prefix.size() != b.prefix.size()) {
        return a.prefix.size() > b.prefix.size();
      }
      return a.prefix < b.prefix;
    });

    out << "\n    server {\n";
    if (key.tls) {
      const auto& pem = certificates.at(key.certificate_id);
      out << "        listen " << settings_.listen_address << ":" << settings_.https_port << " ssl;\n";
      out << "        ssl_certificate " << pem << ";\n";
      out << "        ssl_certificate_key " << pem << ";\n";
    } else {
      out << "        listen " << settings_.listen_address << ":" << settings_.http_port << ";\n";
    }

    out << "        server_name";
    if (server.names.empty()) {
      out << " _";
    }
    for (const auto& name : server.names) {
      out << " " << name;
    }
    out << ";\n\n";

    for (const auto& location : server.locations) {
      WriteLocation(out, location, caching);
    }
    out << "    }\n";
  }

  out << "}\n";
  return out.str();
}

} // namespace hosting::confgen
