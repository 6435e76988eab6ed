#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace hosting::provisioning { class ProvisioningStore; }
namespace hosting::proxy {
class ProcessSupervisor;
class ProxyWatchdog;
}
namespace hosting::redirect {
class RedirectTable;
class RedirectSweeper;
}

namespace hosting::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<provisioning::ProvisioningStore> store;
  std::shared_ptr<proxy::ProcessSupervisor>        supervisor;
  std::shared_ptr<redirect::RedirectTable>         redirects;

  std::shared_ptr<redirect::RedirectSweeper> sweeper;
  std::shared_ptr<proxy::ProxyWatchdog>      watchdog;
};

/*
  Build

  Constructs the entire controller from the runtime config. This is the
  composition root: the only place that knows the concrete proxy type.
  Background workers are constructed but not started.
*/
Application Build(const hosting::runtime::config::RuntimeConfig& config);

} // namespace hosting::factory
