#include "berth/lock/service_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace berth::lock {

namespace {

std::string read_holder(const int fd) {
  char buffer[32] = {};
  const ssize_t n = ::pread(fd, buffer, sizeof(buffer) - 1, 0);
  if (n <= 0) {
    return {};
  }
  std::string pid(buffer, static_cast<std::size_t>(n));
  while (!pid.empty() && (pid.back() == '\n' || pid.back() == ' ')) {
    pid.pop_back();
  }
  return pid;
}

// The holder may unlink the file between our open and flock; the lock then sits on
// an orphaned inode and has to be taken again on the new file.
bool still_linked(const int fd, const std::filesystem::path &path) {
  struct stat held {};
  struct stat named {};
  if (::fstat(fd, &held) != 0 || ::stat(path.c_str(), &named) != 0) {
    return false;
  }
  return held.st_dev == named.st_dev && held.st_ino == named.st_ino;
}

} // namespace

ServiceLock::ServiceLock(const std::filesystem::path &lock_dir, const std::string &service)
    : service_(service), path_(lock_dir / (service + ".lock")) {}

ServiceLock::~ServiceLock() { release(); }

common::Status ServiceLock::acquire() {
  if (fd_ >= 0) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return common::Status::error("creating lock directory: " + ec.message());
  }

  for (;;) {
    const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      return common::Status::error("opening lock file " + path_.string() + ": " +
                                   std::strerror(errno));
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const int error = errno;
      const std::string holder = read_holder(fd);
      ::close(fd);
      if (error == EWOULDBLOCK) {
        return common::Status::error("another berth operation on service '" + service_ +
                                     "' is running" +
                                     (holder.empty() ? "" : " (pid " + holder + ")"));
      }
      return common::Status::error("locking " + path_.string() + ": " + std::strerror(error));
    }
    if (!still_linked(fd, path_)) {
      ::close(fd);
      continue;
    }

    const std::string pid = std::to_string(static_cast<int>(getpid())) + "\n";
    if (::ftruncate(fd, 0) != 0 ||
        ::pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
      const std::string error = std::strerror(errno);
      ::close(fd);
      return common::Status::error("writing lock file " + path_.string() + ": " + error);
    }
    fd_ = fd;
    return common::Status::success();
  }
}

void ServiceLock::release() {
  if (fd_ < 0) {
    return;
  }
  // Unlink before unlocking; a waiter that then locks the old inode sees it unlinked.
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

} // namespace berth::lock
