#include "berth/health/port_check.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace berth::health {

namespace {

constexpr int CONNECT_TIMEOUT_MS = 500;

} // namespace

bool port_accepts_connections(const int port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }

  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  if (inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) != 1) {
    close(fd);
    return false;
  }

  bool connected = ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
  if (!connected && errno == EINPROGRESS) {
    pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
    if (poll(&pfd, 1, CONNECT_TIMEOUT_MS) == 1) {
      int error = 0;
      socklen_t len = sizeof(error);
      connected = getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0;
    }
  }
  close(fd);
  return connected;
}

TcpHealthChecker::TcpHealthChecker(common::IClock &clock, const std::chrono::milliseconds interval)
    : clock_(clock), interval_(interval) {}

common::Status TcpHealthChecker::wait_for_port(const int port,
                                               const std::chrono::milliseconds timeout,
                                               const common::CancellationToken &cancel) {
  const common::RetryPolicy policy{.interval = interval_, .timeout = timeout};
  const auto outcome =
      common::poll_until(clock_, policy, [port] { return port_accepts_connections(port); }, cancel);

  switch (outcome) {
  case common::PollOutcome::Satisfied:
    return common::Status::success();
  case common::PollOutcome::Cancelled:
    return common::Status::error("health check on port " + std::to_string(port) + " cancelled");
  case common::PollOutcome::DeadlineExceeded:
    break;
  }
  return common::Status::error("nothing accepted connections on port " + std::to_string(port) +
                               " within " + std::to_string(timeout.count() / 1000) + "s");
}

} // namespace berth::health
