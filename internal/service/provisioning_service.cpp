#include "provisioning_service.hpp"

#include "internal/provisioning/provisioning_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace hosting::service {

using namespace hosting::v1;

namespace {

hosting::v1::PutResult ToProto(provisioning::PutResult result) {
  switch (result) {
    case provisioning::PutResult::kCreated:
      return PUT_RESULT_CREATED;
    case provisioning::PutResult::kUpdated:
      return PUT_RESULT_UPDATED;
    case provisioning::PutResult::kUnchanged:
      return PUT_RESULT_UNCHANGED;
  }
  return PUT_RESULT_UNSPECIFIED;
}

} // namespace

ProvisioningService::ProvisioningService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PutContentHostingConfigurationResponse ProvisioningService::Put(const PutContentHostingConfigurationRequest& req) {
  return ObserveRpc("ProvisioningService.PutContentHostingConfiguration", req.provisioning_session_id(), [&] {
    if (!req.has_configuration()) {
      throw util::ValidationError("content hosting configuration is required");
    }
    PutContentHostingConfigurationResponse resp;
    resp.set_result(ToProto(ctx_.store->Put(req.provisioning_session_id(), req.configuration())));
    return resp;
  });
}

GetContentHostingConfigurationResponse ProvisioningService::Get(const GetContentHostingConfigurationRequest& req) {
  return ObserveRpc("ProvisioningService.GetContentHostingConfiguration", req.provisioning_session_id(), [&] {
    GetContentHostingConfigurationResponse resp;
    *resp.mutable_configuration() = ctx_.store->Get(req.provisioning_session_id());
    return resp;
  });
}

ListContentHostingConfigurationsResponse ProvisioningService::List(const ListContentHostingConfigurationsRequest&) {
  return ObserveRpc("ProvisioningService.ListContentHostingConfigurations", "", [&] {
    ListContentHostingConfigurationsResponse resp;
    for (auto& id : ctx_.store->ListSessions()) {
      resp.add_provisioning_session_ids(std::move(id));
    }
    return resp;
  });
}

void ProvisioningService::Delete(const DeleteContentHostingConfigurationRequest& req) {
  ObserveRpc("ProvisioningService.DeleteContentHostingConfiguration", req.provisioning_session_id(),
             [&] { ctx_.store->Delete(req.provisioning_session_id()); });
}

PurgeContentHostingCacheResponse ProvisioningService::Purge(const PurgeContentHostingCacheRequest& req) {
  return ObserveRpc("ProvisioningService.PurgeContentHostingCache", req.provisioning_session_id(), [&] {
    PurgeContentHostingCacheResponse resp;
    resp.set_purged_entries(ctx_.store->Purge(req.provisioning_session_id(), req.pattern()));
    return resp;
  });
}

PutCertificateResponse ProvisioningService::PutCertificate(const PutCertificateRequest& req) {
  return ObserveRpc("ProvisioningService.PutCertificate", req.certificate_id(), [&] {
    PutCertificateResponse resp;
    resp.set_result(ToProto(ctx_.store->PutCertificate(req.certificate_id(), req.material())));
    return resp;
  });
}

void ProvisioningService::DeleteCertificate(const DeleteCertificateRequest& req) {
  ObserveRpc("ProvisioningService.DeleteCertificate", req.certificate_id(), [&] { ctx_.store->DeleteCertificate(req.certificate_id()); });
}

ListCertificatesResponse ProvisioningService::ListCertificates(const ListCertificatesRequest&) {
  return ObserveRpc("ProvisioningService.ListCertificates", "", [&] {
    ListCertificatesResponse resp;
    for (auto& info : ctx_.store->ListCertificates()) {
      *resp.add_certificates() = std::move(info);
    }
    return resp;
  });
}

} // namespace hosting::service
