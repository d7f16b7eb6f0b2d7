#pragma once

#include "berth/common/cancellation.hpp"
#include "berth/common/result.hpp"
#include "berth/runner/command_runner.hpp"
#include "berth/state/types.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace berth::proxy {

/// Empty gives no route, a leading '/' a path prefix, anything else a host name.
[[nodiscard]] common::Result<state::Route> infer_route(const std::string &value);

[[nodiscard]] common::Result<std::string> render_route_config(const std::string &service,
                                                              const state::Route &route,
                                                              int port);

class IProxyManager {
public:
  virtual ~IProxyManager() = default;

  /// Validates the config before it goes live; an invalid config is discarded.
  [[nodiscard]] virtual common::Status activate_route(const std::string &service,
                                                      const state::Route &route, int port) = 0;
  [[nodiscard]] virtual common::Status deactivate_route(const std::string &service) = 0;
};

struct NginxOptions {
  std::filesystem::path sites_dir = "/etc/nginx/sites-available";
  std::filesystem::path enabled_dir = "/etc/nginx/sites-enabled";
};

class NginxProxyManager final : public IProxyManager {
public:
  NginxProxyManager(std::shared_ptr<runner::ICommandRunner> runner, NginxOptions options);

  [[nodiscard]] common::Status activate_route(const std::string &service,
                                              const state::Route &route, int port) override;
  [[nodiscard]] common::Status deactivate_route(const std::string &service) override;

  [[nodiscard]] std::filesystem::path config_path(const std::string &service) const;
  [[nodiscard]] std::filesystem::path enabled_path(const std::string &service) const;

private:
  void discard(const std::string &service);

  std::shared_ptr<runner::ICommandRunner> runner_;
  NginxOptions options_;
};

} // namespace berth::proxy
