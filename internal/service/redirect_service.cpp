#include "redirect_service.hpp"

#include "internal/redirect/redirect_table.hpp"
#include "observe_rpc.hpp"

namespace hosting::service {

using namespace hosting::v1;

RedirectService::RedirectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AllocateRedirectResponse RedirectService::Allocate(const AllocateRedirectRequest& req) {
  return ObserveRpc("RedirectService.Allocate", req.session_prefix(), [&] {
    AllocateRedirectResponse resp;
    resp.set_key(ctx_.redirects->Allocate(req.session_prefix(), req.upstream_prefix()));
    return resp;
  });
}

ResolveRedirectResponse RedirectService::Resolve(const ResolveRedirectRequest& req) {
  auto resolution = ctx_.redirects->Resolve(req.path(), req.default_upstream());

  ResolveRedirectResponse resp;
  resp.set_upstream(std::move(resolution.upstream));
  resp.set_remainder(std::move(resolution.remainder));
  resp.set_redirected(resolution.redirected);
  return resp;
}

} // namespace hosting::service
