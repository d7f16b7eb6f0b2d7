#pragma once

#include "berth/common/cancellation.hpp"
#include "berth/common/poll.hpp"
#include "berth/common/result.hpp"

#include <chrono>

namespace berth::health {

class IHealthChecker {
public:
  virtual ~IHealthChecker() = default;

  /// Succeeds once something accepts a TCP connection on 127.0.0.1:port.
  [[nodiscard]] virtual common::Status wait_for_port(int port, std::chrono::milliseconds timeout,
                                                     const common::CancellationToken &cancel) = 0;
};

[[nodiscard]] bool port_accepts_connections(int port);

class TcpHealthChecker final : public IHealthChecker {
public:
  explicit TcpHealthChecker(common::IClock &clock,
                            std::chrono::milliseconds interval = std::chrono::seconds(1));

  [[nodiscard]] common::Status wait_for_port(int port, std::chrono::milliseconds timeout,
                                             const common::CancellationToken &cancel) override;

private:
  common::IClock &clock_;
  std::chrono::milliseconds interval_;
};

} // namespace berth::health
