#include "provisioning_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/proxy/process_supervisor.hpp"
#include "internal/redirect/redirect_table.hpp"
#include "internal/util/errors.hpp"
#include "validation.hpp"

namespace hosting::provisioning {

using observability::IntField;
using observability::StringField;

std::string_view ToString(PutResult result) {
  switch (result) {
    case PutResult::kCreated:
      return "created";
    case PutResult::kUpdated:
      return "updated";
    case PutResult::kUnchanged:
      return "unchanged";
  }
  return "unknown";
}

ProvisioningStore::ProvisioningStore(std::shared_ptr<proxy::ProcessSupervisor> supervisor,
                                     confgen::ConfigGenerator                  generator,
                                     std::shared_ptr<redirect::RedirectTable>  redirects,
                                     CertificateCache                          certificates)
    : supervisor_(std::move(supervisor)),
      generator_(std::move(generator)),
      redirects_(std::move(redirects)),
      certificates_(std::move(certificates)) {
  if (!supervisor_ || !redirects_) {
    throw std::invalid_argument("provisioning store requires a supervisor and a redirect table");
  }
}

confgen::CertificatePaths ProvisioningStore::PathsOf(const State& state) {
  confgen::CertificatePaths paths;
  for (const auto& [id, cert] : state.certificates) {
    paths.emplace(id, cert.path);
  }
  return paths;
}

bool ProvisioningStore::IsReferenced(const State& state, const std::string& certificate_id) {
  for (const auto& [session_id, record] : state.sessions) {
    for (const auto& dc : record.distribution_configurations()) {
      if (dc.certificate_id() == certificate_id) {
        return true;
      }
    }
  }
  return false;
}

std::vector<std::string> ProvisioningStore::PrefixesOf(const hosting::v1::ContentHostingConfiguration& record) {
  std::vector<std::string> prefixes;
  for (const auto& dc : record.distribution_configurations()) {
    prefixes.push_back(dc.path_prefix());
  }
  return prefixes;
}

void ProvisioningStore::ApplyLocked(const State& candidate) {
  // Generation also checks what spans records: prefixes claimed by two
  // sessions and references to unknown certificates.
  const auto artifact = generator_.Generate(candidate.sessions, PathsOf(candidate));
  supervisor_->Apply(artifact);
}

void ProvisioningStore::Publish(State candidate) {
  std::unique_lock lock(state_mutex_);
  state_ = std::move(candidate);
}

void ProvisioningStore::Start() {
  std::lock_guard mutation(mutation_mutex_);
  ApplyLocked(state_);
  HOSTING_LOG_INFO("Provisioning store started", {IntField("sessions", static_cast<std::int64_t>(state_.sessions.size()))});
}

void ProvisioningStore::Shutdown() {
  std::lock_guard mutation(mutation_mutex_);
  supervisor_->Stop();
}

PutResult ProvisioningStore::Put(const std::string& session_id, hosting::v1::ContentHostingConfiguration record) {
  ValidateSessionId(session_id);
  NormalizeRecord(session_id, &record);

  std::lock_guard mutation(mutation_mutex_);

  const auto existing = state_.sessions.find(session_id);
  if (existing != state_.sessions.end() && google::protobuf::util::MessageDifferencer::Equals(existing->second, record)) {
    return PutResult::kUnchanged;
  }

  const auto result  = existing == state_.sessions.end() ? PutResult::kCreated : PutResult::kUpdated;
  const auto removed = existing == state_.sessions.end() ? std::vector<std::string>{} : PrefixesOf(existing->second);
  const auto kept    = PrefixesOf(record);

  State candidate                = state_;
  candidate.sessions[session_id] = std::move(record);

  ApplyLocked(candidate);
  Publish(std::move(candidate));

  // redirects under a prefix the session no longer serves are stale
  for (const auto& prefix : removed) {
    if (std::find(kept.begin(), kept.end(), prefix) == kept.end()) {
      redirects_->Flush(prefix);
    }
  }

  HOSTING_LOG_INFO("Provisioning session stored", {StringField("session", session_id), StringField("result", ToString(result))});
  return result;
}

void ProvisioningStore::Delete(const std::string& session_id) {
  std::lock_guard mutation(mutation_mutex_);

  const auto existing = state_.sessions.find(session_id);
  if (existing == state_.sessions.end()) {
    throw util::NotFound("provisioning session not found: " + session_id);
  }
  const auto prefixes = PrefixesOf(existing->second);

  State candidate = state_;
  candidate.sessions.erase(session_id);

  ApplyLocked(candidate);
  Publish(std::move(candidate));

  std::size_t flushed = 0;
  for (const auto& prefix : prefixes) {
    flushed += redirects_->Flush(prefix);
  }

  // the delete is committed; a purge failure only leaves stale cache files
  try {
    supervisor_->Proxy().Purge(proxy::PurgeRequest{session_id, std::nullopt});
  } catch (const util::UpstreamError& e) {
    HOSTING_LOG_WARN("Cache purge after delete failed", {StringField("session", session_id), StringField("error", e.what())});
  }

  HOSTING_LOG_INFO("Provisioning session deleted", {StringField("session", session_id), IntField("redirects_flushed", static_cast<std::int64_t>(flushed))});
}

std::size_t ProvisioningStore::Purge(const std::string& session_id, const std::string& pattern) {
  auto path_pattern = CompilePurgePattern(pattern);

  std::lock_guard mutation(mutation_mutex_);
  if (state_.sessions.find(session_id) == state_.sessions.end()) {
    throw util::NotFound("provisioning session not found: " + session_id);
  }

  const auto purged = supervisor_->Proxy().Purge(proxy::PurgeRequest{session_id, std::move(path_pattern)});
  HOSTING_LOG_INFO("Cache purged", {StringField("session", session_id), StringField("pattern", pattern), IntField("entries", static_cast<std::int64_t>(purged))});
  return purged;
}

PutResult ProvisioningStore::PutCertificate(const std::string& certificate_id, const std::string& material) {
  ValidateCertificateId(certificate_id);
  if (material.empty()) {
    throw util::ValidationError("certificate " + certificate_id + " has no material");
  }

  std::lock_guard mutation(mutation_mutex_);

  const auto existing = state_.certificates.find(certificate_id);
  if (existing != state_.certificates.end() && existing->second.material == material) {
    return PutResult::kUnchanged;
  }

  const auto result   = existing == state_.certificates.end() ? PutResult::kCreated : PutResult::kUpdated;
  const auto old_path = existing == state_.certificates.end() ? std::string{} : existing->second.path;

  StoredCertificate stored;
  try {
    stored = certificates_.Write(certificate_id, material);
  } catch (const std::runtime_error& e) {
    throw util::UpstreamError(e.what());
  }

  State candidate                         = state_;
  candidate.certificates[certificate_id] = stored;

  if (IsReferenced(candidate, certificate_id)) {
    try {
      ApplyLocked(candidate);
    } catch (const std::exception&) {
      if (stored.path != old_path) {
        certificates_.Remove(stored.path);
      }
      throw;
    }
  }
  Publish(std::move(candidate));

  if (!old_path.empty() && old_path != stored.path) {
    certificates_.Remove(old_path);
  }

  HOSTING_LOG_INFO("Certificate stored", {StringField("certificate", certificate_id), StringField("result", ToString(result))});
  return result;
}

void ProvisioningStore::DeleteCertificate(const std::string& certificate_id) {
  std::lock_guard mutation(mutation_mutex_);

  const auto existing = state_.certificates.find(certificate_id);
  if (existing == state_.certificates.end()) {
    throw util::NotFound("certificate not found: " + certificate_id);
  }
  if (IsReferenced(state_, certificate_id)) {
    throw util::InUse("certificate " + certificate_id + " is used by an active distribution");
  }

  const auto path = existing->second.path;

  State candidate = state_;
  candidate.certificates.erase(certificate_id);
  Publish(std::move(candidate));

  certificates_.Remove(path);
  HOSTING_LOG_INFO("Certificate deleted", {StringField("certificate", certificate_id)});
}

hosting::v1::ContentHostingConfiguration ProvisioningStore::Get(const std::string& session_id) const {
  std::shared_lock lock(state_mutex_);
  const auto       it = state_.sessions.find(session_id);
  if (it == state_.sessions.end()) {
    throw util::NotFound("provisioning session not found: " + session_id);
  }
  return it->second;
}

std::vector<std::string> ProvisioningStore::ListSessions() const {
  std::shared_lock         lock(state_mutex_);
  std::vector<std::string> ids;
  ids.reserve(state_.sessions.size());
  for (const auto& [id, record] : state_.sessions) {
    ids.push_back(id);
  }
  return ids;
}

std::vector<hosting::v1::CertificateInfo> ProvisioningStore::ListCertificates() const {
  std::shared_lock                          lock(state_mutex_);
  std::vector<hosting::v1::CertificateInfo> out;
  out.reserve(state_.certificates.size());
  for (const auto& [id, cert] : state_.certificates) {
    hosting::v1::CertificateInfo info;
    info.set_id(id);
    info.set_path(cert.path);
    info.set_content_tag(cert.content_tag);
    out.push_back(std::move(info));
  }
  return out;
}

std::size_t ProvisioningStore::SessionCount() const {
  std::shared_lock lock(state_mutex_);
  return state_.sessions.size();
}

std::size_t ProvisioningStore::CertificateCount() const {
  std::shared_lock lock(state_mutex_);
  return state_.certificates.size();
}

} // namespace hosting::provisioning
