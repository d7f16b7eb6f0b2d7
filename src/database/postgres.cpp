#include "berth/database/manager.hpp"

#include "berth/creds/credentials.hpp"
#include "berth/isolation/boundary.hpp"

#include <pqxx/pqxx>

#include <utility>

namespace berth::database {

namespace {

constexpr std::size_t PASSWORD_LENGTH = 32;

std::string quote_conninfo_value(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

bool exists(pqxx::nontransaction &tx, const std::string &sql, const std::string &name) {
  return !tx.exec_params(sql, name).empty();
}

} // namespace

std::string build_conninfo(const PostgresOptions &options) {
  std::string conninfo = "host=" + quote_conninfo_value(options.host);
  conninfo += " port=" + std::to_string(options.port);
  conninfo += " user=" + quote_conninfo_value(options.admin_user);
  if (!options.admin_password.empty()) {
    conninfo += " password=" + quote_conninfo_value(options.admin_password);
  }
  conninfo += " dbname=" + quote_conninfo_value(options.admin_database);
  conninfo += " connect_timeout=" + std::to_string(options.connect_timeout_secs);
  conninfo += " application_name='berth'";
  return conninfo;
}

PostgresDatabaseManager::PostgresDatabaseManager(PostgresOptions options)
    : options_(std::move(options)) {}

common::Result<DatabaseCredentials>
PostgresDatabaseManager::create_database(const std::string &service) {
  using CreateResult = common::Result<DatabaseCredentials>;
  if (auto status = isolation::validate_service_name(service); !status.ok()) {
    return CreateResult::failure(status.error());
  }
  const auto boundary = isolation::derive_boundary(service);

  auto password = creds::generate_credential(PASSWORD_LENGTH);
  if (!password.ok()) {
    return CreateResult::failure(password.error());
  }

  bool role_created = false;
  try {
    pqxx::connection conn(build_conninfo(options_));
    // CREATE DATABASE cannot run inside a transaction block.
    pqxx::nontransaction tx(conn);

    if (exists(tx, "SELECT 1 FROM pg_database WHERE datname = $1", boundary.database_name)) {
      return CreateResult::failure("database " + boundary.database_name + " already exists");
    }
    if (exists(tx, "SELECT 1 FROM pg_roles WHERE rolname = $1", boundary.database_user)) {
      return CreateResult::failure("database role " + boundary.database_user + " already exists");
    }

    const std::string role = tx.quote_name(boundary.database_user);
    const std::string db = tx.quote_name(boundary.database_name);
    tx.exec("CREATE ROLE " + role + " LOGIN PASSWORD " + tx.quote(password.value()));
    role_created = true;
    try {
      tx.exec("CREATE DATABASE " + db + " OWNER " + role);
      tx.exec("REVOKE CONNECT ON DATABASE " + db + " FROM PUBLIC");
      tx.exec("GRANT CONNECT ON DATABASE " + db + " TO " + role);
    } catch (const std::exception &ex) {
      std::string message = "creating database " + boundary.database_name + ": " + ex.what();
      try {
        tx.exec("DROP DATABASE IF EXISTS " + db);
        tx.exec("DROP ROLE IF EXISTS " + role);
      } catch (const std::exception &cleanup) {
        message += "; cleanup failed: " + std::string(cleanup.what());
      }
      return CreateResult::failure(message);
    }
  } catch (const std::exception &ex) {
    std::string message = "provisioning database for " + service + ": " + ex.what();
    if (role_created) {
      message += " (role " + boundary.database_user + " may need manual removal)";
    }
    return CreateResult::failure(message);
  }

  DatabaseCredentials credentials;
  credentials.db_name = boundary.database_name;
  credentials.db_user = boundary.database_user;
  credentials.password = std::move(password.value());
  credentials.host = options_.host;
  credentials.port = options_.port;
  return CreateResult::success(std::move(credentials));
}

common::Status PostgresDatabaseManager::drop_database(const std::string &service) {
  if (auto status = isolation::validate_service_name(service); !status.ok()) {
    return status;
  }
  const auto boundary = isolation::derive_boundary(service);
  try {
    pqxx::connection conn(build_conninfo(options_));
    pqxx::nontransaction tx(conn);
    const std::string db = tx.quote_name(boundary.database_name);
    const std::string role = tx.quote_name(boundary.database_user);
    tx.exec("DROP DATABASE IF EXISTS " + db + " WITH (FORCE)");
    tx.exec("DROP ROLE IF EXISTS " + role);
  } catch (const std::exception &ex) {
    return common::Status::error("dropping database " + boundary.database_name + ": " + ex.what());
  }
  return common::Status::success();
}

common::Status PostgresDatabaseManager::ping() {
  try {
    pqxx::connection conn(build_conninfo(options_));
    pqxx::nontransaction tx(conn);
    tx.exec("SELECT 1");
  } catch (const std::exception &ex) {
    return common::Status::error("connecting to " + options_.host + ":" +
                                 std::to_string(options_.port) + ": " + ex.what());
  }
  return common::Status::success();
}

} // namespace berth::database
