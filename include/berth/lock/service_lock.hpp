#pragma once

#include "berth/common/result.hpp"

#include <filesystem>
#include <string>

namespace berth::lock {

/// Advisory per-service lock: an flock held on a pid file under the lock directory.
/// The kernel drops the lock when its holder exits, so a file left behind by a dead
/// process is simply locked again.
class ServiceLock {
public:
  ServiceLock(const std::filesystem::path &lock_dir, const std::string &service);
  ~ServiceLock();

  ServiceLock(const ServiceLock &) = delete;
  ServiceLock &operator=(const ServiceLock &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::string service_;
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace berth::lock
