#include "provisioning_server.hpp"

#include "grpc_error.hpp"

namespace hosting::grpc {

using namespace hosting::v1;

ProvisioningServer::ProvisioningServer(std::shared_ptr<hosting::service::ProvisioningService> svc) : service_(std::move(svc)) {
}

::grpc::Status ProvisioningServer::PutContentHostingConfiguration(::grpc::ServerContext*, const PutContentHostingConfigurationRequest* req,
                                                                  PutContentHostingConfigurationResponse* resp) {
  try {
    *resp = service_->Put(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::GetContentHostingConfiguration(::grpc::ServerContext*, const GetContentHostingConfigurationRequest* req,
                                                                  GetContentHostingConfigurationResponse* resp) {
  try {
    *resp = service_->Get(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::ListContentHostingConfigurations(::grpc::ServerContext*, const ListContentHostingConfigurationsRequest* req,
                                                                    ListContentHostingConfigurationsResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::DeleteContentHostingConfiguration(::grpc::ServerContext*, const DeleteContentHostingConfigurationRequest* req,
                                                                     google::protobuf::Empty*) {
  try {
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::PurgeContentHostingCache(::grpc::ServerContext*, const PurgeContentHostingCacheRequest* req,
                                                            PurgeContentHostingCacheResponse* resp) {
  try {
    *resp = service_->Purge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::PutCertificate(::grpc::ServerContext*, const PutCertificateRequest* req, PutCertificateResponse* resp) {
  try {
    *resp = service_->PutCertificate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::DeleteCertificate(::grpc::ServerContext*, const DeleteCertificateRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteCertificate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::ListCertificates(::grpc::ServerContext*, const ListCertificatesRequest* req, ListCertificatesResponse* resp) {
  try {
    *resp = service_->ListCertificates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace hosting::grpc
