#pragma once

#include "berth/common/result.hpp"

#include <string>

namespace berth::isolation {

/// Every per-service OS and database identity, derived only from the service name.
struct IsolationBoundary {
  std::string service;
  std::string unit_name;
  std::string account;
  std::string database_name;
  std::string database_user;
  std::string route_config;
};

[[nodiscard]] common::Status validate_service_name(const std::string &name);
[[nodiscard]] IsolationBoundary derive_boundary(const std::string &name);

} // namespace berth::isolation
