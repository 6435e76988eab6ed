#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "hosting/v1/provisioning_service.grpc.pb.h"
#include "internal/service/provisioning_service.hpp"

namespace hosting::grpc {

class ProvisioningServer final : public hosting::v1::ProvisioningService::Service {
public:
  explicit ProvisioningServer(std::shared_ptr<hosting::service::ProvisioningService> svc);

  ::grpc::Status PutContentHostingConfiguration(::grpc::ServerContext*,
                                                const hosting::v1::PutContentHostingConfigurationRequest*,
                                                hosting::v1::PutContentHostingConfigurationResponse*) override;

  ::grpc::Status GetContentHostingConfiguration(::grpc::ServerContext*,
                                                const hosting::v1::GetContentHostingConfigurationRequest*,
                                                hosting::v1::GetContentHostingConfigurationResponse*) override;

  ::grpc::Status ListContentHostingConfigurations(::grpc::ServerContext*,
                                                  const hosting::v1::ListContentHostingConfigurationsRequest*,
                                                  hosting::v1::ListContentHostingConfigurationsResponse*) override;

  ::grpc::Status DeleteContentHostingConfiguration(::grpc::ServerContext*,
                                                   const hosting::v1::DeleteContentHostingConfigurationRequest*,
                                                   google::protobuf::Empty*) override;

  ::grpc::Status PurgeContentHostingCache(::grpc::ServerContext*,
                                          const hosting::v1::PurgeContentHostingCacheRequest*,
                                          hosting::v1::PurgeContentHostingCacheResponse*) override;

  ::grpc::Status PutCertificate(::grpc::ServerContext*,
                                const hosting::v1::PutCertificateRequest*,
                                hosting::v1::PutCertificateResponse*) override;

  ::grpc::Status DeleteCertificate(::grpc::ServerContext*,
                                   const hosting::v1::DeleteCertificateRequest*,
                                   google::protobuf::Empty*) override;

  ::grpc::Status ListCertificates(::grpc::ServerContext*,
                                  const hosting::v1::ListCertificatesRequest*,
                                  hosting::v1::ListCertificatesResponse*) override;

private:
  std::shared_ptr<hosting::service::ProvisioningService> service_;
};

} // namespace hosting::grpc
