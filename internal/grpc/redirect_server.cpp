#include "redirect_server.hpp"

#include "grpc_error.hpp"

namespace hosting::grpc {

RedirectServer::RedirectServer(std::shared_ptr<hosting::service::RedirectService> svc) : service_(std::move(svc)) {
}

::grpc::Status RedirectServer::Allocate(::grpc::ServerContext*, const hosting::v1::AllocateRedirectRequest* req,
                                        hosting::v1::AllocateRedirectResponse* resp) {
  try {
    *resp = service_->Allocate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RedirectServer::Resolve(::grpc::ServerContext*, const hosting::v1::ResolveRedirectRequest* req,
                                       hosting::v1::ResolveRedirectResponse* resp) {
  try {
    *resp = service_->Resolve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace hosting::grpc
