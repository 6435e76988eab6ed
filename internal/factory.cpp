#include "factory.hpp"

#include <memory>

#include "internal/confgen/config_generator.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/provisioning_server.hpp"
#include "internal/grpc/redirect_server.hpp"
#include "internal/provisioning/certificate_cache.hpp"
#include "internal/provisioning/provisioning_store.hpp"
#include "internal/proxy/artifact_store.hpp"
#include "internal/proxy/nginx_proxy.hpp"
#include "internal/proxy/process_supervisor.hpp"
#include "internal/proxy/proxy_watchdog.hpp"
#include "internal/redirect/redirect_sweeper.hpp"
#include "internal/redirect/redirect_table.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/provisioning_service.hpp"
#include "internal/service/redirect_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace hosting::factory {

/*
    Build full application dependency graph
*/
Application Build(const hosting::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto& proxy_config    = config.proxy();
  const auto& redirect_config = config.redirect();

  // ------------------------------------------------------------------
  // Redirect table
  // ------------------------------------------------------------------
  redirect::RedirectTable::Options redirect_options;
  redirect_options.ttl    = util::FromProto(redirect_config.ttl());
  redirect_options.shards = redirect_config.shards();

  app.redirects = std::make_shared<redirect::RedirectTable>(redirect_options);
  app.sweeper   = std::make_shared<redirect::RedirectSweeper>(app.redirects, util::FromProto(redirect_config.sweep_interval()));

  // ------------------------------------------------------------------
  // Proxy supervision
  // ------------------------------------------------------------------
  auto nginx = std::make_shared<proxy::NginxProxy>(proxy::NginxSettings::FromConfig(proxy_config));

  app.supervisor = std::make_shared<proxy::ProcessSupervisor>(nginx, proxy::ArtifactStore(proxy_config.config_dir()),
                                                              proxy::SupervisorSettings::FromConfig(proxy_config));
  app.watchdog   = std::make_shared<proxy::ProxyWatchdog>(app.supervisor, proxy::WatchdogSettings::FromConfig(proxy_config));

  // ------------------------------------------------------------------
  // Provisioning
  // ------------------------------------------------------------------
  app.store = std::make_shared<provisioning::ProvisioningStore>(app.supervisor,
                                                                confgen::ConfigGenerator(confgen::GeneratorSettings::FromConfig(config)),
                                                                app.redirects,
                                                                provisioning::CertificateCache(proxy_config.certificates_dir()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store      = app.store;
  ctx.supervisor = app.supervisor;
  ctx.redirects  = app.redirects;

  auto provisioning_service = std::make_shared<service::ProvisioningService>(ctx);
  auto redirect_service     = std::make_shared<service::RedirectService>(ctx);
  auto admin_service        = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ProvisioningServer>(provisioning_service));
  app.grpc_services.push_back(std::make_unique<grpc::RedirectServer>(redirect_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace hosting::factory
