#include "berth/proxy/proxy.hpp"

#include "berth/common/fs.hpp"
#include "berth/isolation/boundary.hpp"

#include <cctype>
#include <sstream>

namespace berth::proxy {

namespace {

constexpr const char *FORWARD_HEADERS = "proxy_set_header Host $host;\n"
                                        "proxy_set_header X-Real-IP $remote_addr;\n"
                                        "proxy_set_header X-Forwarded-For "
                                        "$proxy_add_x_forwarded_for;\n"
                                        "proxy_set_header X-Forwarded-Proto $scheme;\n";

std::string indent(const std::string &block, const std::string &prefix) {
  std::istringstream in(block);
  std::string line;
  std::string out;
  while (std::getline(in, line)) {
    out += prefix + line + "\n";
  }
  return out;
}

bool valid_route_char(const char ch, const state::RouteType type) {
  const auto uch = static_cast<unsigned char>(ch);
  if (std::isalnum(uch) != 0 || ch == '-' || ch == '.' || ch == '_') {
    return true;
  }
  return type == state::RouteType::Path && (ch == '/' || ch == '~');
}

} // namespace

common::Result<state::Route> infer_route(const std::string &value) {
  state::Route route;
  route.value = common::trim(value);
  if (route.value.empty()) {
    return common::Result<state::Route>::success(std::move(route));
  }

  route.type = route.value.front() == '/' ? state::RouteType::Path : state::RouteType::Subdomain;
  for (const char ch : route.value) {
    if (!valid_route_char(ch, route.type)) {
      return common::Result<state::Route>::failure("route '" + route.value +
                                                   "' contains invalid character '" +
                                                   std::string(1, ch) + "'");
    }
  }
  if (route.type == state::RouteType::Subdomain) {
    route.value = common::to_lower(route.value);
  }
  return common::Result<state::Route>::success(std::move(route));
}

common::Result<std::string> render_route_config(const std::string &service,
                                                const state::Route &route, const int port) {
  const std::string upstream = "proxy_pass http://127.0.0.1:" + std::to_string(port) + ";\n";
  std::string out = "# managed by berth for service " + service + "\n";
  switch (route.type) {
  case state::RouteType::Subdomain:
    out += "server {\n";
    out += "    listen 80;\n";
    out += "    server_name " + route.value + ";\n\n";
    out += "    location / {\n";
    out += indent(upstream + FORWARD_HEADERS, "        ");
    out += "    }\n";
    out += "}\n";
    return common::Result<std::string>::success(std::move(out));
  case state::RouteType::Path:
    out += "location " + route.value + " {\n";
    out += indent(upstream + FORWARD_HEADERS, "    ");
    out += "}\n";
    return common::Result<std::string>::success(std::move(out));
  case state::RouteType::None:
    break;
  }
  return common::Result<std::string>::failure("service '" + service + "' has no route to render");
}

NginxProxyManager::NginxProxyManager(std::shared_ptr<runner::ICommandRunner> runner,
                                     NginxOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {}

std::filesystem::path NginxProxyManager::config_path(const std::string &service) const {
  return options_.sites_dir / isolation::derive_boundary(service).route_config;
}

std::filesystem::path NginxProxyManager::enabled_path(const std::string &service) const {
  return options_.enabled_dir / isolation::derive_boundary(service).route_config;
}

void NginxProxyManager::discard(const std::string &service) {
  std::error_code ec;
  std::filesystem::remove(enabled_path(service), ec);
  std::filesystem::remove(config_path(service), ec);
}

common::Status NginxProxyManager::activate_route(const std::string &service,
                                                 const state::Route &route, const int port) {
  auto rendered = render_route_config(service, route, port);
  if (!rendered.ok()) {
    return rendered.status();
  }

  const auto config = config_path(service);
  auto written = common::write_file_atomic(config, rendered.value(),
                                           std::filesystem::perms::owner_read |
                                               std::filesystem::perms::owner_write |
                                               std::filesystem::perms::group_read |
                                               std::filesystem::perms::others_read);
  if (!written.ok()) {
    return written.with_context("writing nginx config");
  }

  std::error_code ec;
  const auto link = enabled_path(service);
  std::filesystem::remove(link, ec);
  std::filesystem::create_symlink(config, link, ec);
  if (ec) {
    discard(service);
    return common::Status::error("enabling nginx config " + link.string() + ": " + ec.message());
  }

  auto test = runner_->run({"nginx", "-t"}, {.allow_failure = true});
  if (!test.ok() || test.value().exit_code != 0) {
    discard(service);
    const std::string detail =
        test.ok() ? common::trim(test.value().stderr_text) : test.error();
    return common::Status::error("nginx config test failed (config rolled back): " + detail);
  }

  auto reload = runner_->run({"systemctl", "reload", "nginx"});
  if (!reload.ok()) {
    discard(service);
    return common::Status::error("reloading nginx (config rolled back): " + reload.error());
  }
  return common::Status::success();
}

common::Status NginxProxyManager::deactivate_route(const std::string &service) {
  std::error_code ec;
  std::filesystem::remove(enabled_path(service), ec);
  if (ec) {
    return common::Status::error("removing " + enabled_path(service).string() + ": " +
                                 ec.message());
  }
  std::filesystem::remove(config_path(service), ec);
  if (ec) {
    return common::Status::error("removing " + config_path(service).string() + ": " +
                                 ec.message());
  }

  auto reload = runner_->run({"systemctl", "reload", "nginx"});
  if (!reload.ok()) {
    return common::Status::error("reloading nginx: " + reload.error());
  }
  return common::Status::success();
}

} // namespace berth::proxy
