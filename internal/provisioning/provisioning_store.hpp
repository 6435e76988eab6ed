#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "certificate_cache.hpp"
#include "hosting/v1/provisioning.pb.h"
#include "internal/confgen/config_generator.hpp"
#include "internal/util/ticket_mutex.hpp"

namespace hosting::proxy {
class ProcessSupervisor;
}

namespace hosting::redirect {
class RedirectTable;
}

namespace hosting::provisioning {

enum class PutResult {
  kCreated,
  kUpdated,
  kUnchanged,
};

std::string_view ToString(PutResult result);

/*
  Authoritative in-memory provisioning state.

  Every mutation builds a candidate state, renders the complete proxy
  configuration from it and applies that through the supervisor. Only an
  applied candidate becomes visible; any failure leaves the previous state
  (and the previous proxy configuration) in place.

  Mutations are admitted in FIFO order and run one at a time. Reads work on
  the committed state under a shared lock and never wait for a reload.
*/
class ProvisioningStore {
 public:
  ProvisioningStore(std::shared_ptr<proxy::ProcessSupervisor> supervisor,
                    confgen::ConfigGenerator                  generator,
                    std::shared_ptr<redirect::RedirectTable>  redirects,
                    CertificateCache                          certificates);

  ProvisioningStore(const ProvisioningStore&)            = delete;
  ProvisioningStore& operator=(const ProvisioningStore&) = delete;

  // Applies the configuration of the current (initially empty) state.
  void Start();
  void Shutdown();

  PutResult Put(const std::string& session_id, hosting::v1::ContentHostingConfiguration record);
  void      Delete(const std::string& session_id);

  // Drops the session's cached content, or only paths matching pattern.
  std::size_t Purge(const std::string& session_id, const std::string& pattern = {});

  PutResult PutCertificate(const std::string& certificate_id, const std::string& material);
  void      DeleteCertificate(const std::string& certificate_id);

  hosting::v1::ContentHostingConfiguration Get(const std::string& session_id) const;
  std::vector<std::string>                 ListSessions() const;
  std::vector<hosting::v1::CertificateInfo> ListCertificates() const;

  std::size_t SessionCount() const;
  std::size_t CertificateCount() const;

 private:
  struct State {
    confgen::SessionMap                      sessions;
    std::map<std::string, StoredCertificate> certificates;
  };

  // Renders and applies candidate. Throws without touching state_.
  void ApplyLocked(const State& candidate);
  void Publish(State candidate);

  static confgen::CertificatePaths PathsOf(const State& state);
  static bool                      IsReferenced(const State& state, const std::string& certificate_id);
  static std::vector<std::string>  PrefixesOf(const hosting::v1::ContentHostingConfiguration& record);

  std::shared_ptr<proxy::ProcessSupervisor> supervisor_;
  confgen::ConfigGenerator                  generator_;
  std::shared_ptr<redirect::RedirectTable>  redirects_;
  CertificateCache                          certificates_;

  // Held for the whole of a mutation, FIFO.
  util::TicketMutex mutation_mutex_;

  // Guards state_ for readers; writers also hold mutation_mutex_.
  mutable std::shared_mutex state_mutex_;
  State                     state_;
};

} // namespace hosting::provisioning
