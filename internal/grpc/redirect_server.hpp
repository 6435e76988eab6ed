#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "hosting/v1/provisioning_service.grpc.pb.h"
#include "internal/service/redirect_service.hpp"

namespace hosting::grpc {

class RedirectServer final : public hosting::v1::RedirectService::Service {
public:
  explicit RedirectServer(std::shared_ptr<hosting::service::RedirectService> svc);

  ::grpc::Status Allocate(::grpc::ServerContext*,
                          const hosting::v1::AllocateRedirectRequest*,
                          hosting::v1::AllocateRedirectResponse*) override;

  ::grpc::Status Resolve(::grpc::ServerContext*,
                         const hosting::v1::ResolveRedirectRequest*,
                         hosting::v1::ResolveRedirectResponse*) override;

private:
  std::shared_ptr<hosting::service::RedirectService> service_;
};

} // namespace hosting::grpc
