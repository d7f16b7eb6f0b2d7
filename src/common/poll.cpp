#include "berth/common/poll.hpp"

#include <algorithm>
#include <thread>

namespace berth::common {

std::chrono::steady_clock::time_point SystemClock::now() { return std::chrono::steady_clock::now(); }

void SystemClock::sleep_for(const std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

const char *poll_outcome_to_string(const PollOutcome outcome) {
  switch (outcome) {
  case PollOutcome::Satisfied:
    return "satisfied";
  case PollOutcome::DeadlineExceeded:
    return "deadline exceeded";
  case PollOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

PollOutcome poll_until(IClock &clock, const RetryPolicy &policy,
                       const std::function<bool()> &predicate, const CancellationToken &cancel) {
  const auto deadline = clock.now() + policy.timeout;
  while (true) {
    if (cancel.cancelled()) {
      return PollOutcome::Cancelled;
    }
    if (predicate()) {
      return PollOutcome::Satisfied;
    }

    const auto now = clock.now();
    if (now >= deadline) {
      return PollOutcome::DeadlineExceeded;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    clock.sleep_for(std::max(std::chrono::milliseconds(1), std::min(policy.interval, remaining)));
  }
}

} // namespace berth::common
