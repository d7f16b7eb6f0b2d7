#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/health/port_check.hpp"
#include "berth/lock/service_lock.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

/// Listening socket on an ephemeral loopback port, closed on destruction.
class Listener {
public:
  Listener() {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      throw std::runtime_error("socket failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        listen(fd_, 4) != 0) {
      close(fd_);
      throw std::runtime_error("bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~Listener() { stop(); }

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;

  void stop() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

  [[nodiscard]] int port() const { return port_; }

private:
  int fd_ = -1;
  int port_ = 0;
};

} // namespace

void register_health_lock_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;

  tests.push_back({"health_check_sees_listening_port", [] {
                     Listener listener;
                     require(berth::health::port_accepts_connections(listener.port()),
                             "open port accepts");
                     const int port = listener.port();
                     listener.stop();
                     require(!berth::health::port_accepts_connections(port),
                             "closed port refuses");
                   }});

  tests.push_back({"health_checker_succeeds_immediately_on_open_port", [] {
                     Listener listener;
                     berth::testing::FakeClock clock;
                     berth::health::TcpHealthChecker checker(clock);
                     auto status = checker.wait_for_port(listener.port(), std::chrono::seconds(5),
                                                         berth::common::CancellationToken{});
                     require(status.ok(), "healthy");
                     require(clock.sleeps() == 0, "no waiting");
                   }});

  tests.push_back({"health_checker_times_out_on_closed_port", [] {
                     int port = 0;
                     {
                       Listener listener;
                       port = listener.port();
                     }
                     berth::testing::FakeClock clock;
                     berth::health::TcpHealthChecker checker(clock);
                     auto status = checker.wait_for_port(port, std::chrono::seconds(3),
                                                         berth::common::CancellationToken{});
                     require(!status.ok(), "unhealthy");
                     require(status.error().find("within 3s") != std::string::npos, "message");
                     require(clock.slept() == std::chrono::seconds(3), "waited full timeout");

                     berth::common::CancellationToken cancel;
                     cancel.cancel();
                     auto cancelled = checker.wait_for_port(port, std::chrono::seconds(3), cancel);
                     require(!cancelled.ok() &&
                                 cancelled.error().find("cancelled") != std::string::npos,
                             "cancelled");
                   }});

  tests.push_back({"service_lock_excludes_second_holder", [] {
                     berth::testing::TempDir dir;
                     berth::lock::ServiceLock first(dir.path() / "locks", "api");
                     require(first.acquire().ok(), "first acquires");
                     require(std::filesystem::exists(first.path()), "lock file exists");

                     berth::lock::ServiceLock second(dir.path() / "locks", "api");
                     auto blocked = second.acquire();
                     require(!blocked.ok(), "second is refused");
                     require(blocked.error().find("'api'") != std::string::npos, "names service");

                     berth::lock::ServiceLock other(dir.path() / "locks", "web");
                     require(other.acquire().ok(), "other service is independent");

                     first.release();
                     require(!std::filesystem::exists(first.path()), "released");
                     require(second.acquire().ok(), "second acquires after release");
                   }});

  tests.push_back({"service_lock_takes_over_stale_file", [] {
                     berth::testing::TempDir dir;
                     dir.create_file("locks/api.lock", "2147483000\n");
                     {
                       berth::lock::ServiceLock lock(dir.path() / "locks", "api");
                       require(lock.acquire().ok(), "stale lock taken over");
                       std::ifstream in(lock.path());
                       int pid = 0;
                       in >> pid;
                       require(pid == static_cast<int>(getpid()), "own pid recorded");
                     }
                     require(!std::filesystem::exists(dir.path() / "locks" / "api.lock"),
                             "destructor releases");
                   }});

  tests.push_back({"service_lock_ignores_unlocked_file_naming_live_pid", [] {
                     berth::testing::TempDir dir;
                     // A pid file whose writer never held the lock does not block.
                     dir.create_file("locks/api.lock", std::to_string(getppid()) + "\n");
                     berth::lock::ServiceLock lock(dir.path() / "locks", "api");
                     require(lock.acquire().ok(), "acquired");
                     require(lock.acquire().ok(), "acquire is idempotent");

                     berth::lock::ServiceLock second(dir.path() / "locks", "api");
                     auto blocked = second.acquire();
                     require(!blocked.ok(), "held lock refuses");
                     require(blocked.error().find("pid " + std::to_string(getpid())) !=
                                 std::string::npos,
                             "names the holder");
                   }});
}
