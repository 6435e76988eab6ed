#pragma once

#include "hosting/v1/provisioning_service.pb.h"
#include "service_context.hpp"

namespace hosting::service {

/*
  Request-time redirect lookups for the proxy. Resolve sits on the hot path
  of every proxied request and only logs failures.
*/
class RedirectService {
public:
  explicit RedirectService(ServiceContext ctx);

  hosting::v1::AllocateRedirectResponse
  Allocate(const hosting::v1::AllocateRedirectRequest& req);

  hosting::v1::ResolveRedirectResponse
  Resolve(const hosting::v1::ResolveRedirectRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace hosting::service
