#include "berth/isolation/boundary.hpp"

#include <cctype>

namespace berth::isolation {

namespace {

constexpr std::size_t MAX_NAME_LENGTH = 48;

bool is_name_char(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return std::isalnum(uch) != 0 || ch == '_' || ch == '-';
}

} // namespace

common::Status validate_service_name(const std::string &name) {
  if (name.empty()) {
    return common::Status::error("service name must not be empty");
  }
  if (name.size() > MAX_NAME_LENGTH) {
    return common::Status::error("service name '" + name + "' is longer than " +
                                 std::to_string(MAX_NAME_LENGTH) + " characters");
  }
  if (std::isalnum(static_cast<unsigned char>(name.front())) == 0) {
    return common::Status::error("service name '" + name +
                                 "' must start with a letter or digit");
  }
  for (const char ch : name) {
    if (!is_name_char(ch)) {
      return common::Status::error("service name '" + name +
                                   "' may only contain letters, digits, '_' and '-'");
    }
  }
  return common::Status::success();
}

IsolationBoundary derive_boundary(const std::string &name) {
  IsolationBoundary boundary;
  boundary.service = name;
  boundary.account = "berth-" + name;
  boundary.unit_name = boundary.account + ".service";
  boundary.route_config = boundary.account + ".conf";
  boundary.database_name = "berth_" + name;
  boundary.database_user = boundary.database_name;
  return boundary;
}

} // namespace berth::isolation
