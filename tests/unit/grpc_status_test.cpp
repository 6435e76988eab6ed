#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "fake_web_proxy.hpp"
#include "hosting/v1.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/provisioning_server.hpp"
#include "internal/grpc/redirect_server.hpp"
#include "internal/provisioning/provisioning_store.hpp"
#include "internal/proxy/process_supervisor.hpp"
#include "internal/redirect/redirect_table.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace hosting::v1;
using namespace std::chrono_literals;

struct Servers {
  std::shared_ptr<hosting::testing::FakeWebProxy> proxy;
  hosting::service::ServiceContext                ctx;

  std::unique_ptr<hosting::grpc::ProvisioningServer> provisioning;
  std::unique_ptr<hosting::grpc::RedirectServer>     redirect;
  std::unique_ptr<hosting::grpc::AdminServer>        admin;

  Servers() : proxy(std::make_shared<hosting::testing::FakeWebProxy>()) {
    const auto dir = hosting::testing::FreshDirectory("grpc_status");

    hosting::proxy::SupervisorSettings settings;
    settings.readiness_timeout = 10ms;
    settings.shutdown_timeout  = 10ms;
    settings.retry_backoff     = 1ms;

    hosting::confgen::GeneratorSettings generator;
    generator.cache_dir = (dir / "cache").string();
    generator.temp_root = dir.string();

    ctx.supervisor = std::make_shared<hosting::proxy::ProcessSupervisor>(proxy, hosting::proxy::ArtifactStore((dir / "conf").string()), settings);
    ctx.redirects  = std::make_shared<hosting::redirect::RedirectTable>();
    ctx.store      = std::make_shared<hosting::provisioning::ProvisioningStore>(
        ctx.supervisor, hosting::confgen::ConfigGenerator(generator), ctx.redirects,
        hosting::provisioning::CertificateCache((dir / "certs").string()));
    ctx.store->Start();

    provisioning = std::make_unique<hosting::grpc::ProvisioningServer>(std::make_shared<hosting::service::ProvisioningService>(ctx));
    redirect     = std::make_unique<hosting::grpc::RedirectServer>(std::make_shared<hosting::service::RedirectService>(ctx));
    admin        = std::make_unique<hosting::grpc::AdminServer>(std::make_shared<hosting::service::AdminService>(ctx));
  }
};

PutContentHostingConfigurationRequest PutRequest(const std::string& session_id, const std::string& origin) {
  PutContentHostingConfigurationRequest req;
  req.set_provisioning_session_id(session_id);

  auto* chc    = req.mutable_configuration();
  auto* ingest = chc->add_ingest_configurations();
  ingest->set_id("origin");
  ingest->set_pull(true);
  ingest->set_protocol(kHttpPullIngestProtocol);
  ingest->set_base_url(origin);

  auto* dc = chc->add_distribution_configurations();
  dc->set_path_prefix("/m4d/" + session_id + "/");
  dc->set_ingest_id("origin");
  return req;
}

void TestErrorMapping() {
  using hosting::grpc::ToStatus;
  assert(ToStatus(hosting::util::ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(hosting::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(hosting::util::InUse("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(hosting::util::ConfigInvalid("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(hosting::util::StartupError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(hosting::util::ReloadError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(hosting::util::UpstreamError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(hosting::util::NotFound("session S1")).error_message() == "session S1");
}

void TestProvisioningRoundTrip() {
  Servers s;

  const auto                             req = PutRequest("S1", "https://origin.example/");
  PutContentHostingConfigurationResponse put;
  auto status = s.provisioning->PutContentHostingConfiguration(nullptr, &req, &put);
  assert(status.ok());
  assert(put.result() == PUT_RESULT_CREATED);

  status = s.provisioning->PutContentHostingConfiguration(nullptr, &req, &put);
  assert(status.ok());
  assert(put.result() == PUT_RESULT_UNCHANGED);

  GetContentHostingConfigurationRequest get_req;
  get_req.set_provisioning_session_id("S1");
  GetContentHostingConfigurationResponse get;
  assert(s.provisioning->GetContentHostingConfiguration(nullptr, &get_req, &get).ok());
  assert(get.configuration().distribution_configurations(0).path_prefix() == "/m4d/S1/");

  ListContentHostingConfigurationsRequest  list_req;
  ListContentHostingConfigurationsResponse list;
  assert(s.provisioning->ListContentHostingConfigurations(nullptr, &list_req, &list).ok());
  assert(list.provisioning_session_ids_size() == 1);

  StatusRequest  status_req;
  StatusResponse admin;
  assert(s.admin->Status(nullptr, &status_req, &admin).ok());
  assert(admin.proxy_state() == PROXY_STATE_RUNNING);
  assert(admin.sessions() == 1);
  assert(admin.healthy());
  assert(admin.applied_version() == 2);
  // Start applied version 1, the Put reloaded to version 2
  assert(admin.reloads() == 1);
  assert(admin.rollbacks() == 0);
  assert(admin.restarts() == 0);
}

void TestProvisioningErrorsBecomeStatusCodes() {
  Servers s;

  PutContentHostingConfigurationRequest   empty;
  PutContentHostingConfigurationResponse  put;
  empty.set_provisioning_session_id("S1");
  assert(s.provisioning->PutContentHostingConfiguration(nullptr, &empty, &put).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetContentHostingConfigurationRequest  get_req;
  GetContentHostingConfigurationResponse get;
  get_req.set_provisioning_session_id("missing");
  assert(s.provisioning->GetContentHostingConfiguration(nullptr, &get_req, &get).error_code() == ::grpc::StatusCode::NOT_FOUND);

  DeleteContentHostingConfigurationRequest del;
  google::protobuf::Empty                  none;
  del.set_provisioning_session_id("missing");
  assert(s.provisioning->DeleteContentHostingConfiguration(nullptr, &del, &none).error_code() == ::grpc::StatusCode::NOT_FOUND);

  s.proxy->reject_marker = "broken.example";
  const auto broken      = PutRequest("S2", "https://broken.example/");
  assert(s.provisioning->PutContentHostingConfiguration(nullptr, &broken, &put).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  // certificate in use
  PutCertificateRequest  cert;
  PutCertificateResponse cert_resp;
  cert.set_certificate_id("cert-1");
  cert.set_material("PEM");
  assert(s.provisioning->PutCertificate(nullptr, &cert, &cert_resp).ok());
  assert(cert_resp.result() == PUT_RESULT_CREATED);

  auto secure = PutRequest("S3", "https://origin.example/");
  secure.mutable_configuration()->mutable_distribution_configurations(0)->set_certificate_id("cert-1");
  assert(s.provisioning->PutContentHostingConfiguration(nullptr, &secure, &put).ok());

  DeleteCertificateRequest del_cert;
  del_cert.set_certificate_id("cert-1");
  assert(s.provisioning->DeleteCertificate(nullptr, &del_cert, &none).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  PurgeContentHostingCacheRequest  purge;
  PurgeContentHostingCacheResponse purged;
  purge.set_provisioning_session_id("S3");
  s.proxy->purge_fails = true;
  assert(s.provisioning->PurgeContentHostingCache(nullptr, &purge, &purged).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestRedirectServer() {
  Servers s;

  AllocateRedirectRequest  alloc;
  AllocateRedirectResponse key;
  alloc.set_session_prefix("/m4d/S1/");
  alloc.set_upstream_prefix("https://edge-2.example/m4d/S1/");
  assert(s.redirect->Allocate(nullptr, &alloc, &key).ok());

  ResolveRedirectRequest  resolve;
  ResolveRedirectResponse resolved;
  resolve.set_path(key.key() + "seg-1.m4s");
  resolve.set_default_upstream("https://origin.example/");
  assert(s.redirect->Resolve(nullptr, &resolve, &resolved).ok());
  assert(resolved.redirected());
  assert(resolved.upstream() == "https://edge-2.example/m4d/S1/");
  assert(resolved.remainder() == "/seg-1.m4s");

  alloc.set_session_prefix("no-slash");
  assert(s.redirect->Allocate(nullptr, &alloc, &key).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorMapping();
  TestProvisioningRoundTrip();
  TestProvisioningErrorsBecomeStatusCodes();
  TestRedirectServer();

  std::cout << "hosting_controller_unit_grpc_status: pass\n";
  return 0;
}
