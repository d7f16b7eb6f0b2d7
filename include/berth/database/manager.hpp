#pragma once

#include "berth/common/result.hpp"

#include <string>

namespace berth::database {

struct DatabaseCredentials {
  std::string db_name;
  std::string db_user;
  std::string password;
  std::string host;
  int port = 0;
};

/// One database and one login role per service, both named from the service.
class IDatabaseManager {
public:
  virtual ~IDatabaseManager() = default;

  [[nodiscard]] virtual common::Result<DatabaseCredentials>
  create_database(const std::string &service) = 0;
  [[nodiscard]] virtual common::Status drop_database(const std::string &service) = 0;
  [[nodiscard]] virtual common::Status ping() = 0;
};

struct PostgresOptions {
  std::string host = "127.0.0.1";
  int port = 5432;
  std::string admin_user = "postgres";
  std::string admin_password;
  std::string admin_database = "postgres";
  int connect_timeout_secs = 10;
};

/// libpq keyword/value connection string with every value quoted.
[[nodiscard]] std::string build_conninfo(const PostgresOptions &options);

class PostgresDatabaseManager final : public IDatabaseManager {
public:
  explicit PostgresDatabaseManager(PostgresOptions options);

  [[nodiscard]] common::Result<DatabaseCredentials>
  create_database(const std::string &service) override;
  [[nodiscard]] common::Status drop_database(const std::string &service) override;
  [[nodiscard]] common::Status ping() override;

private:
  PostgresOptions options_;
};

} // namespace berth::database
