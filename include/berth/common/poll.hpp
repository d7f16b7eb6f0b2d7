#pragma once

#include "berth/common/cancellation.hpp"

#include <chrono>
#include <functional>

namespace berth::common {

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] std::chrono::steady_clock::time_point now() override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

struct RetryPolicy {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds timeout{10'000};
};

enum class PollOutcome {
  Satisfied,
  DeadlineExceeded,
  Cancelled,
};

[[nodiscard]] const char *poll_outcome_to_string(PollOutcome outcome);

/// Evaluate `predicate` until it returns true, the policy deadline passes or `cancel` fires.
/// The predicate runs at least once; sleeps never overshoot the deadline.
[[nodiscard]] PollOutcome poll_until(IClock &clock, const RetryPolicy &policy,
                                     const std::function<bool()> &predicate,
                                     const CancellationToken &cancel);

} // namespace berth::common
