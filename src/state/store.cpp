#include "berth/state/store.hpp"

#include "berth/common/json_util.hpp"

#include <ctime>

namespace berth::state {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;
constexpr const char *SERVICE_COLUMNS =
    "name, repo, version, prev_version, port, route_type, route_value, db_name, db_user, "
    "extra_env, deployed_at, updated_at";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::int64_t unix_now() { return static_cast<std::int64_t>(std::time(nullptr)); }

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? "" : text;
}

void bind_text_or_null(sqlite3_stmt *stmt, const int index, const std::string &value) {
  if (value.empty()) {
    sqlite3_bind_null(stmt, index);
  } else {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
}

// Empty maps are stored as NULL so they read back as absent.
std::string encode_map(const EnvMap &values) {
  return values.empty() ? "" : common::json_encode_flat(values);
}

EnvMap decode_map(const std::string &json) {
  if (json.empty()) {
    return {};
  }
  return common::json_parse_flat(json);
}

Service row_to_service(sqlite3_stmt *stmt) {
  Service service;
  service.name = column_text(stmt, 0);
  service.repo = column_text(stmt, 1);
  service.version = column_text(stmt, 2);
  if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
    service.previous_version = column_text(stmt, 3);
  }
  service.port = sqlite3_column_int(stmt, 4);
  service.route.type = route_type_from_string(column_text(stmt, 5)).value_or(RouteType::None);
  service.route.value = column_text(stmt, 6);
  service.db_name = column_text(stmt, 7);
  service.db_user = column_text(stmt, 8);
  service.extra_env = decode_map(column_text(stmt, 9));
  service.deployed_at = sqlite3_column_int64(stmt, 10);
  service.updated_at = sqlite3_column_int64(stmt, 11);
  return service;
}

void bind_service_fields(sqlite3_stmt *stmt, const Service &service) {
  sqlite3_bind_text(stmt, 1, service.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, service.repo.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, service.version.c_str(), -1, SQLITE_TRANSIENT);
  if (service.previous_version.has_value()) {
    sqlite3_bind_text(stmt, 4, service.previous_version->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 4);
  }
  sqlite3_bind_int(stmt, 5, service.port);
  const std::string route_type = route_type_to_string(service.route.type);
  sqlite3_bind_text(stmt, 6, route_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, service.route.value.c_str(), -1, SQLITE_TRANSIENT);
  bind_text_or_null(stmt, 8, service.db_name);
  bind_text_or_null(stmt, 9, service.db_user);
  bind_text_or_null(stmt, 10, encode_map(service.extra_env));
}

} // namespace

StateStore::StateStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

StateStore::~StateStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status StateStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  if (!db_path_.parent_path().empty()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("creating state directory " +
                                   db_path_.parent_path().string() + ": " + ec.message());
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return common::Status::error("opening state store " + db_path_.string() + ": " + message);
  }
  sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

  auto status = init_schema();
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
    return status.with_context("initializing state schema");
  }
  return common::Status::success();
}

common::Status StateStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS services (
  name TEXT PRIMARY KEY,
  repo TEXT NOT NULL,
  version TEXT NOT NULL,
  prev_version TEXT,
  port INTEGER NOT NULL UNIQUE,
  route_type TEXT NOT NULL DEFAULT '',
  route_value TEXT NOT NULL DEFAULT '',
  db_name TEXT,
  db_user TEXT,
  extra_env TEXT,
  deployed_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS history (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  service TEXT NOT NULL,
  action TEXT NOT NULL,
  version TEXT NOT NULL,
  timestamp INTEGER NOT NULL,
  detail TEXT
);
CREATE INDEX IF NOT EXISTS history_service ON history(service, id);
)");
}

common::Result<bool> StateStore::service_exists_locked(const std::string &name) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM services WHERE name = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(rc == SQLITE_ROW);
}

common::Result<std::optional<std::string>> StateStore::port_owner_locked(const int port) {
  using OwnerResult = common::Result<std::optional<std::string>>;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT name FROM services WHERE port = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return OwnerResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int(stmt, 1, port);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    std::string owner = column_text(stmt, 0);
    sqlite3_finalize(stmt);
    return OwnerResult::success(std::move(owner));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return OwnerResult::failure(sqlite3_errmsg(db_));
  }
  return OwnerResult::success(std::nullopt);
}

common::Status StateStore::insert_locked(const Service &service) {
  auto exists = service_exists_locked(service.name);
  if (!exists.ok()) {
    return common::Status::error(exists.error());
  }
  if (exists.value()) {
    return common::Status::error("service '" + service.name + "' already exists");
  }

  auto owner = port_owner_locked(service.port);
  if (!owner.ok()) {
    return common::Status::error(owner.error());
  }
  if (owner.value().has_value()) {
    return common::Status::error("port " + std::to_string(service.port) +
                                 " is already in use by service '" + *owner.value() + "'");
  }

  const std::string sql = std::string("INSERT INTO services(") + SERVICE_COLUMNS +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::int64_t now = unix_now();
  bind_service_fields(stmt, service);
  sqlite3_bind_int64(stmt, 11, service.deployed_at != 0 ? service.deployed_at : now);
  sqlite3_bind_int64(stmt, 12, service.updated_at != 0 ? service.updated_at : now);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status StateStore::insert_service(const Service &service) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("state store is not open");
  }

  // IMMEDIATE takes the write lock up front so other processes cannot slip in
  // between the uniqueness checks and the insert.
  auto status = exec_sql(db_, "BEGIN IMMEDIATE");
  if (!status.ok()) {
    return status.with_context("inserting service '" + service.name + "'");
  }

  status = insert_locked(service);
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return status;
  }
  return exec_sql(db_, "COMMIT").with_context("inserting service '" + service.name + "'");
}

common::Result<std::optional<Service>> StateStore::get_service(const std::string &name) {
  using GetResult = common::Result<std::optional<Service>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return GetResult::failure("state store is not open");
  }

  const std::string sql =
      std::string("SELECT ") + SERVICE_COLUMNS + " FROM services WHERE name = ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return GetResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    Service service = row_to_service(stmt);
    sqlite3_finalize(stmt);
    return GetResult::success(std::move(service));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return GetResult::failure(sqlite3_errmsg(db_));
  }
  return GetResult::success(std::nullopt);
}

common::Result<std::vector<Service>> StateStore::list_services() {
  using ListResult = common::Result<std::vector<Service>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ListResult::failure("state store is not open");
  }

  const std::string sql = std::string("SELECT ") + SERVICE_COLUMNS + " FROM services ORDER BY name";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return ListResult::failure(sqlite3_errmsg(db_));
  }

  std::vector<Service> services;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    services.push_back(row_to_service(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ListResult::failure(sqlite3_errmsg(db_));
  }
  return ListResult::success(std::move(services));
}

common::Result<bool> StateStore::update_service(const Service &service) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("state store is not open");
  }

  const char *sql = "UPDATE services SET repo = ?2, version = ?3, prev_version = ?4, port = ?5, "
                    "route_type = ?6, route_value = ?7, db_name = ?8, db_user = ?9, "
                    "extra_env = ?10, updated_at = ?11 WHERE name = ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  bind_service_fields(stmt, service);
  sqlite3_bind_int64(stmt, 11, service.updated_at != 0 ? service.updated_at : unix_now());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<bool> StateStore::delete_service(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("state store is not open");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM services WHERE name = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::vector<int>> StateStore::used_ports() {
  using PortsResult = common::Result<std::vector<int>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return PortsResult::failure("state store is not open");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT port FROM services ORDER BY port", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return PortsResult::failure(sqlite3_errmsg(db_));
  }

  std::vector<int> ports;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ports.push_back(sqlite3_column_int(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return PortsResult::failure(sqlite3_errmsg(db_));
  }
  return PortsResult::success(std::move(ports));
}

common::Result<std::optional<std::string>> StateStore::port_owner(const int port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<std::string>>::failure("state store is not open");
  }
  return port_owner_locked(port);
}

common::Status StateStore::append_history(const HistoryEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("state store is not open");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO history(service, action, version, timestamp, detail) VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, entry.service.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, entry.action.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.version.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, entry.timestamp != 0 ? entry.timestamp : unix_now());
  bind_text_or_null(stmt, 5, encode_map(entry.detail));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<HistoryEntry>> StateStore::list_history(const std::string &service) {
  using HistoryResult = common::Result<std::vector<HistoryEntry>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return HistoryResult::failure("state store is not open");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, service, action, version, timestamp, detail FROM history "
                    "WHERE service = ?1 ORDER BY id DESC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return HistoryResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, service.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<HistoryEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    HistoryEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.service = column_text(stmt, 1);
    entry.action = column_text(stmt, 2);
    entry.version = column_text(stmt, 3);
    entry.timestamp = sqlite3_column_int64(stmt, 4);
    entry.detail = decode_map(column_text(stmt, 5));
    entries.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return HistoryResult::failure(sqlite3_errmsg(db_));
  }
  return HistoryResult::success(std::move(entries));
}

} // namespace berth::state
