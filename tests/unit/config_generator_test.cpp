#include "internal/confgen/config_generator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "hosting/v1.hpp"
#include "internal/confgen/directives.hpp"
#include "internal/util/errors.hpp"

namespace {

using hosting::confgen::CertificatePaths;
using hosting::confgen::ConfigGenerator;
using hosting::confgen::GeneratorSettings;
using hosting::confgen::SessionMap;
using hosting::v1::ContentHostingConfiguration;

GeneratorSettings MakeSettings() {
  GeneratorSettings settings;
  settings.listen_address = "[::]";
  settings.http_port      = 8080;
  settings.https_port     = 8443;
  settings.error_log      = "/var/log/hc/error.log";
  settings.access_log     = "/var/log/hc/access.log";
  settings.pid_path       = "/run/hc/nginx.pid";
  settings.cache_dir      = "/var/cache/hc/cache";
  settings.temp_root      = "/var/cache/hc";
  return settings;
}

ContentHostingConfiguration IngestRecord(const std::string& prefix, const std::string& origin, const std::string& domain = "cdn.example") {
  ContentHostingConfiguration chc;
  chc.set_name("record");

  auto* ingest = chc.add_ingest_configurations();
  ingest->set_id("origin");
  ingest->set_pull(true);
  ingest->set_protocol(hosting::v1::kHttpPullIngestProtocol);
  ingest->set_base_url(origin);

  auto* dc = chc.add_distribution_configurations();
  dc->set_path_prefix(prefix);
  dc->set_canonical_domain_name(domain);
  dc->set_ingest_id("origin");
  return chc;
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const hosting::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestScenarioRoutesPrefixToOrigin() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["S1"] = IngestRecord("/m4d/S1/", "https://origin.example/");

  const auto text = generator.Generate(sessions, {});
  assert(Contains(text, "location /m4d/S1/ {"));
  assert(Contains(text, "proxy_pass https://origin.example/;"));
  assert(Contains(text, "proxy_cache_key \"S1:u=$uri\";"));
  assert(Contains(text, "proxy_cache cacheone;"));
  assert(Contains(text, "listen [::]:8080;"));
  assert(Contains(text, "server_name cdn.example;"));
}

void TestGenerationIsDeterministic() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["S2"] = IngestRecord("/m4d/S2/", "http://b.example/media");
  sessions["S1"] = IngestRecord("/m4d/S1/", "https://a.example/");

  const auto first  = generator.Generate(sessions, {});
  const auto second = generator.Generate(sessions, {});
  assert(first == second);
  assert(Contains(first, "proxy_pass http://b.example/media/;"));
}

void TestLongerPrefixesComeFirst() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["A"] = IngestRecord("/a/", "https://a.example/");
  sessions["B"] = IngestRecord("/a/b/", "https://b.example/");

  const auto text = generator.Generate(sessions, {});
  const auto ab   = text.find("location /a/b/ {");
  const auto a    = text.find("location /a/ {");
  assert(ab != std::string::npos);
  assert(a != std::string::npos);
  assert(ab < a);
}

void TestIdenticalPrefixAcrossSessionsIsRejected() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["A"] = IngestRecord("/shared/", "https://a.example/");
  sessions["B"] = IngestRecord("shared", "https://b.example/");

  assert(ThrowsValidation([&] { generator.Generate(sessions, {}); }));
}

void TestTlsDistributionsGetTheirOwnServer() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;

  auto secure = IngestRecord("/secure/", "https://a.example/", "secure.example");
  secure.mutable_distribution_configurations(0)->set_certificate_id("cert-1");
  secure.mutable_distribution_configurations(0)->set_domain_name_alias("alias.example");
  sessions["S1"] = secure;
  sessions["S2"] = IngestRecord("/plain/", "https://b.example/", "plain.example");

  CertificatePaths certs{{"cert-1", "/certs/cert-1-abc.pem"}};
  const auto       text = generator.Generate(sessions, certs);

  assert(Contains(text, "listen [::]:8443 ssl;"));
  assert(Contains(text, "ssl_certificate /certs/cert-1-abc.pem;"));
  assert(Contains(text, "ssl_certificate_key /certs/cert-1-abc.pem;"));
  assert(Contains(text, "server_name alias.example secure.example;"));
  assert(Contains(text, "server_name plain.example;"));

  // plain listener first
  assert(text.find("listen [::]:8080;") < text.find("listen [::]:8443 ssl;"));
}

void TestUnknownCertificateIsRejected() {
  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["S1"] = IngestRecord("/secure/", "https://a.example/");
  sessions["S1"].mutable_distribution_configurations(0)->set_certificate_id("missing");

  assert(ThrowsValidation([&] { generator.Generate(sessions, {}); }));
}

void TestStaticDistributionUsesAlias() {
  ConfigGenerator             generator(MakeSettings());
  SessionMap                  sessions;
  ContentHostingConfiguration chc;
  auto*                       dc = chc.add_distribution_configurations();
  dc->set_path_prefix("/static/S3");
  dc->set_document_root("/srv/www/s3");
  sessions["S3"] = chc;

  const auto text = generator.Generate(sessions, {});
  assert(Contains(text, "location /static/S3/ {"));
  assert(Contains(text, "alias /srv/www/s3/;"));
  assert(Contains(text, "server_name _;"));
}

void TestRedirectZoneIsDeclared() {
  ConfigGenerator generator(MakeSettings());
  const auto      text = generator.Generate({}, {});

  assert(Contains(text, "default \"dynredirmap:10m\";"));
  assert(Contains(text, "default \"120\";"));
  assert(Contains(text, "pid /run/hc/nginx.pid;"));
  assert(Contains(text, "proxy_temp_path /var/cache/hc/proxy-tmp;"));
  assert(Contains(text, "proxy_cache_path /var/cache/hc/cache levels=1:2 use_temp_path=on keys_zone=cacheone:10m;"));
}

void TestRewriteRulesKeepTheRestOfThePath() {
  auto rule = hosting::confgen::TransformRewriteRule("/low/", "/high/");
  assert(rule.first == "^(.*)/low/([^?#]*/)?([^/]*(?:#[^?/]*)?(?:\\?.*)?)$");
  assert(rule.second == "${1}/high/$2$3");

  auto anchored = hosting::confgen::TransformRewriteRule("^/m4d/(v[0-9]+)/$", "/media/$1/");
  assert(anchored.first == "^/m4d/(v[0-9]+)/([^/]*(?:#[^?/]*)?(?:\\?.*)?)$");
  assert(anchored.second == "/media/$1/$2");

  ConfigGenerator generator(MakeSettings());
  SessionMap      sessions;
  sessions["S1"] = IngestRecord("/m4d/S1/", "https://origin.example/");
  auto* rr       = sessions["S1"].mutable_distribution_configurations(0)->add_path_rewrite_rules();
  rr->set_request_pattern("/low/");
  rr->set_mapped_path("/high/");

  const auto text = generator.Generate(sessions, {});
  assert(Contains(text, "rewrite \"^(.*)/low/([^?#]*/)?([^/]*(?:#[^?/]*)?(?:\\?.*)?)$\" \"${1}/high/$2$3\" break;"));
}

void TestInvalidRewriteRuleIsRejected() {
  assert(ThrowsValidation([] { hosting::confgen::TransformRewriteRule("(unclosed", "/x/"); }));
  assert(ThrowsValidation([] { hosting::confgen::TransformRewriteRule("/a\"b/", "/x/"); }));
}

void TestPrefixAndOriginNormalization() {
  assert(hosting::confgen::NormalizePathPrefix("m4d/S1") == "/m4d/S1/");
  assert(hosting::confgen::NormalizePathPrefix("/m4d/S1/") == "/m4d/S1/");
  assert(ThrowsValidation([] { hosting::confgen::NormalizePathPrefix("/a//b/"); }));
  assert(ThrowsValidation([] { hosting::confgen::NormalizePathPrefix("/a/../b/"); }));
  assert(ThrowsValidation([] { hosting::confgen::NormalizePathPrefix("/a b/"); }));
  assert(ThrowsValidation([] { hosting::confgen::NormalizePathPrefix("/a;b/"); }));

  assert(hosting::confgen::ParseOrigin("HTTPS://origin.example").Url() == "https://origin.example/");
  assert(hosting::confgen::ParseOrigin("http://origin.example:8080/base").Url() == "http://origin.example:8080/base/");
  assert(ThrowsValidation([] { hosting::confgen::ParseOrigin("ftp://origin.example/"); }));
  assert(ThrowsValidation([] { hosting::confgen::ParseOrigin("https:///path"); }));
  assert(ThrowsValidation([] { hosting::confgen::ParseOrigin("origin.example"); }));
}

} // namespace

int main() {
  TestScenarioRoutesPrefixToOrigin();
  TestGenerationIsDeterministic();
  TestLongerPrefixesComeFirst();
  TestIdenticalPrefixAcrossSessionsIsRejected();
  TestTlsDistributionsGetTheirOwnServer();
  TestUnknownCertificateIsRejected();
  TestStaticDistributionUsesAlias();
  TestRedirectZoneIsDeclared();
  TestRewriteRulesKeepTheRestOfThePath();
  TestInvalidRewriteRuleIsRejected();
  TestPrefixAndOriginNormalization();

  std::cout << "hosting_controller_unit_config_generator: pass\n";
  return 0;
}
