#pragma once

#include "berth/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace berth::ports {

/// Live view of which service holds which port.
class IPortLedger {
public:
  virtual ~IPortLedger() = default;

  [[nodiscard]] virtual common::Result<std::vector<int>> used_ports() = 0;
  [[nodiscard]] virtual common::Result<std::optional<std::string>> port_owner(int port) = 0;
};

enum class PortVerdict {
  Free,
  OutOfRange,
  Taken,
};

struct PortCheck {
  PortVerdict verdict = PortVerdict::Free;
  std::string owner;
  std::string message;
};

/// Assigns ports from [range_start, range_end). Assignment depends only on the ledger contents.
class PortAllocator {
public:
  PortAllocator(int range_start, int range_end, IPortLedger &ledger);

  [[nodiscard]] common::Result<int> next() const;
  [[nodiscard]] common::Result<PortCheck> check(int port) const;
  [[nodiscard]] bool in_range(int port) const;

  [[nodiscard]] int range_start() const { return range_start_; }
  [[nodiscard]] int range_end() const { return range_end_; }

private:
  int range_start_;
  int range_end_;
  IPortLedger &ledger_;
};

} // namespace berth::ports
