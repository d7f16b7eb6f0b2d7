#include "berth/ports/allocator.hpp"

#include <unordered_set>

namespace berth::ports {

PortAllocator::PortAllocator(const int range_start, const int range_end, IPortLedger &ledger)
    : range_start_(range_start), range_end_(range_end), ledger_(ledger) {}

bool PortAllocator::in_range(const int port) const {
  return port >= range_start_ && port < range_end_;
}

common::Result<int> PortAllocator::next() const {
  auto used = ledger_.used_ports();
  if (!used.ok()) {
    return common::Result<int>::failure("listing used ports: " + used.error());
  }

  const std::unordered_set<int> taken(used.value().begin(), used.value().end());
  for (int port = range_start_; port < range_end_; ++port) {
    if (!taken.contains(port)) {
      return common::Result<int>::success(port);
    }
  }
  return common::Result<int>::failure("port range " + std::to_string(range_start_) + "-" +
                                      std::to_string(range_end_) +
                                      " exhausted; widen [ports] or remove unused services");
}

common::Result<PortCheck> PortAllocator::check(const int port) const {
  PortCheck result;
  if (!in_range(port)) {
    result.verdict = PortVerdict::OutOfRange;
    result.message = "port " + std::to_string(port) + " is outside configured range " +
                     std::to_string(range_start_) + "-" + std::to_string(range_end_);
    return common::Result<PortCheck>::success(std::move(result));
  }

  auto owner = ledger_.port_owner(port);
  if (!owner.ok()) {
    return common::Result<PortCheck>::failure("checking port " + std::to_string(port) + ": " +
                                              owner.error());
  }
  if (owner.value().has_value()) {
    result.verdict = PortVerdict::Taken;
    result.owner = *owner.value();
    result.message = "port " + std::to_string(port) + " is already in use by service '" +
                     result.owner + "'";
  }
  return common::Result<PortCheck>::success(std::move(result));
}

} // namespace berth::ports
