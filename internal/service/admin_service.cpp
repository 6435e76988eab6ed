#include "admin_service.hpp"

#include "internal/provisioning/provisioning_store.hpp"
#include "internal/proxy/process_supervisor.hpp"
#include "internal/redirect/redirect_table.hpp"
#include "observe_rpc.hpp"

namespace hosting::service {

using namespace hosting::v1;

namespace {

hosting::v1::ProxyState ToProto(model::ProxyState state) {
  switch (state) {
    case model::ProxyState::kStopped:
      return PROXY_STATE_STOPPED;
    case model::ProxyState::kStarting:
      return PROXY_STATE_STARTING;
    case model::ProxyState::kRunning:
      return PROXY_STATE_RUNNING;
    case model::ProxyState::kReloading:
      return PROXY_STATE_RELOADING;
    case model::ProxyState::kFailed:
      return PROXY_STATE_FAILED;
  }
  return PROXY_STATE_UNSPECIFIED;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatusResponse AdminService::Status(const StatusRequest&) {
  return ObserveRpc("AdminService.Status", "", [&] {
    StatusResponse resp;
    resp.set_proxy_state(ToProto(ctx_.supervisor->State()));
    resp.set_applied_version(ctx_.supervisor->AppliedVersion());
    resp.set_pid(ctx_.supervisor->Pid());
    resp.set_healthy(ctx_.supervisor->LastHealth());
    resp.set_sessions(ctx_.store->SessionCount());
    resp.set_certificates(ctx_.store->CertificateCount());
    resp.set_redirect_entries(ctx_.redirects->Size());

    const auto counters = ctx_.supervisor->Counters();
    resp.set_reloads(counters.reloads);
    resp.set_rollbacks(counters.rollbacks);
    resp.set_restarts(counters.restarts);
    return resp;
  });
}

} // namespace hosting::service
