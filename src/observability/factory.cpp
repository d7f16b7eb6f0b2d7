#include "berth/observability/factory.hpp"

#include "berth/common/fs.hpp"
#include "berth/observability/log_observer.hpp"

namespace berth::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace berth::observability
