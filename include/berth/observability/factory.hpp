#pragma once

#include "berth/config/schema.hpp"
#include "berth/observability/observer.hpp"

#include <memory>

namespace berth::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace berth::observability
