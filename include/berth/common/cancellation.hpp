#pragma once

#include <atomic>
#include <memory>

namespace berth::common {

/// Copies share one flag. A default-constructed token can be cancelled like any other.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  [[nodiscard]] bool cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace berth::common
