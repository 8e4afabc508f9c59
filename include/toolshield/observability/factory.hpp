#pragma once

#include "toolshield/config/schema.hpp"
#include "toolshield/observability/observer.hpp"

#include <memory>

namespace toolshield::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace toolshield::observability
