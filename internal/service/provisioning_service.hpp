#pragma once

#include "hosting/v1/provisioning_service.pb.h"
#include "service_context.hpp"

namespace hosting::service {

class ProvisioningService {
public:
  explicit ProvisioningService(ServiceContext ctx);

  hosting::v1::PutContentHostingConfigurationResponse
  Put(const hosting::v1::PutContentHostingConfigurationRequest& req);

  hosting::v1::GetContentHostingConfigurationResponse
  Get(const hosting::v1::GetContentHostingConfigurationRequest& req);

  hosting::v1::ListContentHostingConfigurationsResponse
  List(const hosting::v1::ListContentHostingConfigurationsRequest& req);

  void Delete(const hosting::v1::DeleteContentHostingConfigurationRequest& req);

  hosting::v1::PurgeContentHostingCacheResponse
  Purge(const hosting::v1::PurgeContentHostingCacheRequest& req);

  hosting::v1::PutCertificateResponse
  PutCertificate(const hosting::v1::PutCertificateRequest& req);

  void DeleteCertificate(const hosting::v1::DeleteCertificateRequest& req);

  hosting::v1::ListCertificatesResponse
  ListCertificates(const hosting::v1::ListCertificatesRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace hosting::service
