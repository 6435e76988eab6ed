#include "validation.hpp"

#include <cctype>
#include <set>

#include "hosting/v1.hpp"
#include "internal/confgen/directives.hpp"
#include "internal/util/errors.hpp"

namespace hosting::provisioning {

using util::ValidationError;

namespace {

void ValidateIdentifier(const char* what, const std::string& id) {
  if (id.empty()) {
    throw ValidationError(std::string(what) + " must not be empty");
  }
  if (id == "." || id == "..") {
    throw ValidationError(std::string(what) + " must not be a relative path component");
  }
  for (char c : id) {
    const auto u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '-' && c != '_' && c != '.') {
      throw ValidationError(std::string(what) + " contains invalid character: " + id);
    }
  }
}

void ValidateDomainName(const std::string& session_id, const std::string& name) {
  for (char c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '-' && c != '.' && c != '*') {
      throw ValidationError("session " + session_id + ": invalid domain name: " + name);
    }
  }
}

} // namespace

void ValidateSessionId(const std::string& session_id) {
  ValidateIdentifier("provisioning session id", session_id);
}

void ValidateCertificateId(const std::string& certificate_id) {
  ValidateIdentifier("certificate id", certificate_id);
}

void NormalizeRecord(const std::string& session_id, hosting::v1::ContentHostingConfiguration* record) {
  std::set<std::string> ingest_ids;
  for (const auto& ingest : record->ingest_configurations()) {
    if (ingest.id().empty()) {
      throw ValidationError("session " + session_id + ": ingest configuration needs an id");
    }
    if (!ingest_ids.insert(ingest.id()).second) {
      throw ValidationError("session " + session_id + ": duplicate ingest id " + ingest.id());
    }
    if (!ingest.pull() || ingest.protocol() != hosting::v1::kHttpPullIngestProtocol) {
      throw ValidationError("session " + session_id + ": ingest " + ingest.id() + " must be a pull ingest using " + hosting::v1::kHttpPullIngestProtocol);
    }
    confgen::ParseOrigin(ingest.base_url());
  }

  std::set<std::string> prefixes;
  for (auto& dc : *record->mutable_distribution_configurations()) {
    dc.set_path_prefix(confgen::NormalizePathPrefix(dc.path_prefix()));
    if (!prefixes.insert(dc.path_prefix()).second) {
      throw ValidationError("session " + session_id + ": path prefix " + dc.path_prefix() + " is used twice");
    }

    ValidateDomainName(session_id, dc.canonical_domain_name());
    ValidateDomainName(session_id, dc.domain_name_alias());
    if (!dc.certificate_id().empty()) {
      ValidateCertificateId(dc.certificate_id());
    }

    switch (dc.source_case()) {
      case hosting::v1::DistributionConfiguration::kIngestId:
        if (ingest_ids.count(dc.ingest_id()) == 0) {
          throw ValidationError("session " + session_id + ": " + dc.path_prefix() + " references unknown ingest " + dc.ingest_id());
        }
        break;
      case hosting::v1::DistributionConfiguration::kDocumentRoot:
        if (dc.document_root().empty() || dc.document_root().front() != '/' || !confgen::IsSafeToken(dc.document_root())) {
          throw ValidationError("session " + session_id + ": document root must be an absolute path: " + dc.document_root());
        }
        break;
      default:
        throw ValidationError("session " + session_id + ": " + dc.path_prefix() + " needs an ingest or a document root");
    }

    for (const auto& rule : dc.path_rewrite_rules()) {
      confgen::TransformRewriteRule(rule.request_pattern(), rule.mapped_path());
    }
  }
}

std::optional<std::regex> CompilePurgePattern(const std::string& pattern) {
  if (pattern.empty()) {
    return std::nullopt;
  }
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw ValidationError("purge pattern does not compile: " + pattern + " (" + e.what() + ")");
  }
}

} // namespace hosting::provisioning
