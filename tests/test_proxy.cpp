#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/proxy/proxy.hpp"

#include <filesystem>
#include <memory>

namespace {

namespace px = berth::proxy;
using berth::state::RouteType;
using berth::testing::FakeCommandRunner;

struct ProxyFixture {
  berth::testing::TempDir dir;
  std::shared_ptr<FakeCommandRunner> runner = std::make_shared<FakeCommandRunner>();
  px::NginxProxyManager proxy;

  ProxyFixture()
      : proxy(runner, px::NginxOptions{.sites_dir = dir.path() / "sites-available",
                                       .enabled_dir = dir.path() / "sites-enabled"}) {
    std::filesystem::create_directories(dir.path() / "sites-enabled");
  }
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_proxy_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;

  tests.push_back({"proxy_infers_route_kind", [] {
                     auto none = px::infer_route("  ");
                     require(none.ok() && none.value().empty(), "blank is no route");

                     auto host = px::infer_route("API.Example.com");
                     require(host.ok() && host.value().type == RouteType::Subdomain, "host");
                     require(host.value().value == "api.example.com", "host lowercased");

                     auto path = px::infer_route("/api/v1");
                     require(path.ok() && path.value().type == RouteType::Path, "path");
                     require(path.value().value == "/api/v1", "path kept");

                     require(!px::infer_route("api.example.com;").ok(), "semicolon rejected");
                     require(!px::infer_route("/api {").ok(), "brace rejected");
                   }});

  tests.push_back({"proxy_renders_server_block_for_host", [] {
                     auto config = px::render_route_config(
                         "api", {RouteType::Subdomain, "api.example.com"}, 3000);
                     require(config.ok(), "renders");
                     require(contains(config.value(), "server_name api.example.com;"),
                             "server name");
                     require(contains(config.value(), "proxy_pass http://127.0.0.1:3000;"),
                             "upstream");
                     require(contains(config.value(), "X-Forwarded-For"), "forward headers");
                   }});

  tests.push_back({"proxy_renders_location_for_path", [] {
                     auto config =
                         px::render_route_config("api", {RouteType::Path, "/api"}, 3001);
                     require(config.ok(), "renders");
                     require(contains(config.value(), "location /api {"), "location block");
                     require(!contains(config.value(), "server {"), "no server block");
                     require(!px::render_route_config("api", {}, 3001).ok(), "no route fails");
                   }});

  tests.push_back({"proxy_activate_writes_links_tests_and_reloads", [] {
                     ProxyFixture fx;
                     auto status = fx.proxy.activate_route(
                         "api", {RouteType::Subdomain, "api.example.com"}, 3000);
                     require(status.ok(), "activates");
                     const auto config = fx.proxy.config_path("api");
                     require(config.filename() == "berth-api.conf", "config name");
                     require(std::filesystem::exists(config), "config written");
                     require(std::filesystem::is_symlink(fx.proxy.enabled_path("api")), "linked");
                     require(fx.runner->calls() ==
                                 std::vector<std::string>({"nginx -t", "systemctl reload nginx"}),
                             "tested before reload");
                   }});

  tests.push_back({"proxy_invalid_config_is_discarded", [] {
                     ProxyFixture fx;
                     fx.runner->respond("nginx -t",
                                        {.exit_code = 1,
                                         .stderr_text = "nginx: [emerg] unknown directive"});
                     auto status = fx.proxy.activate_route("api", {RouteType::Path, "/api"}, 3000);
                     require(!status.ok(), "activation fails");
                     require(contains(status.error(), "unknown directive"), "nginx output");
                     require(contains(status.error(), "rolled back"), "says it rolled back");
                     require(!std::filesystem::exists(fx.proxy.config_path("api")), "config gone");
                     require(!std::filesystem::is_symlink(fx.proxy.enabled_path("api")),
                             "link gone");
                     require(!fx.runner->ran("systemctl reload nginx"), "never reloaded");
                   }});

  tests.push_back({"proxy_deactivate_removes_files_and_reloads", [] {
                     ProxyFixture fx;
                     require(fx.proxy.activate_route("api", {RouteType::Path, "/api"}, 3000).ok(),
                             "activates");
                     require(fx.proxy.deactivate_route("api").ok(), "deactivates");
                     require(!std::filesystem::exists(fx.proxy.config_path("api")), "config gone");
                     require(fx.runner->count("systemctl reload nginx") == 2, "reloaded again");
                     require(fx.proxy.deactivate_route("api").ok(), "idempotent");
                   }});
}
