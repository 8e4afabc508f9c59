#include "toolshield/observability/factory.hpp"

#include "toolshield/common/fs.hpp"
#include "toolshield/observability/log_observer.hpp"
#include "toolshield/observability/multi_observer.hpp"
#include "toolshield/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace toolshield::observability {

namespace {

std::vector<std::string> backend_names(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(common::to_lower(backend));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      names.push_back(name);
    }
  }
  return names;
}

// Anything validate_config did not already reject as unknown is a log backend.
std::unique_ptr<IObserver> create_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = backend_names(config.observability.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return create_backend(names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(create_backend(name));
  }
  return multi;
}

} // namespace toolshield::observability
