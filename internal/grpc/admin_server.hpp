#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "hosting/v1/provisioning_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace hosting::grpc {

class AdminServer final : public hosting::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<hosting::service::AdminService> svc);

  ::grpc::Status Status(::grpc::ServerContext*,
                        const hosting::v1::StatusRequest*,
                        hosting::v1::StatusResponse*) override;

private:
  std::shared_ptr<hosting::service::AdminService> service_;
};

} // namespace hosting::grpc
