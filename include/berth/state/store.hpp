#pragma once

#include "berth/common/result.hpp"
#include "berth/ports/allocator.hpp"
#include "berth/state/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace berth::state {

/// SQLite-backed record of deployed services plus an append-only history ledger.
/// All calls are serialized on one mutex; a missing name is reported as an empty
/// optional or `false`, never as a failure.
class StateStore final : public ports::IPortLedger {
public:
  explicit StateStore(std::filesystem::path db_path);
  ~StateStore() override;

  StateStore(const StateStore &) = delete;
  StateStore &operator=(const StateStore &) = delete;

  [[nodiscard]] common::Status open();
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Status insert_service(const Service &service);
  [[nodiscard]] common::Result<std::optional<Service>> get_service(const std::string &name);
  [[nodiscard]] common::Result<std::vector<Service>> list_services();
  [[nodiscard]] common::Result<bool> update_service(const Service &service);
  [[nodiscard]] common::Result<bool> delete_service(const std::string &name);

  [[nodiscard]] common::Result<std::vector<int>> used_ports() override;
  [[nodiscard]] common::Result<std::optional<std::string>> port_owner(int port) override;

  [[nodiscard]] common::Status append_history(const HistoryEntry &entry);
  /// Newest first.
  [[nodiscard]] common::Result<std::vector<HistoryEntry>> list_history(const std::string &service);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<std::string>> port_owner_locked(int port);
  [[nodiscard]] common::Result<bool> service_exists_locked(const std::string &name);
  [[nodiscard]] common::Status insert_locked(const Service &service);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace berth::state
