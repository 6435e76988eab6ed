#pragma once

#include "hosting/v1/provisioning_service.pb.h"
#include "service_context.hpp"

namespace hosting::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  hosting::v1::StatusResponse Status(const hosting::v1::StatusRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace hosting::service
