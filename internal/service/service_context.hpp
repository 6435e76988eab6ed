#pragma once

#include <memory>

namespace hosting::provisioning { class ProvisioningStore; }
namespace hosting::proxy { class ProcessSupervisor; }
namespace hosting::redirect { class RedirectTable; }

namespace hosting::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<hosting::provisioning::ProvisioningStore> store;
  std::shared_ptr<hosting::proxy::ProcessSupervisor>        supervisor;
  std::shared_ptr<hosting::redirect::RedirectTable>         redirects;
};

} // namespace hosting::service
