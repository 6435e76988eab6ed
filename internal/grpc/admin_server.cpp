#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace hosting::grpc {

AdminServer::AdminServer(std::shared_ptr<hosting::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Status(::grpc::ServerContext*, const hosting::v1::StatusRequest* req, hosting::v1::StatusResponse* resp) {
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace hosting::grpc
