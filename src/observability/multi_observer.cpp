#include "toolshield/observability/multi_observer.hpp"

#include <algorithm>

namespace toolshield::observability {

MultiObserver::MultiObserver(std::vector<std::shared_ptr<IObserver>> backends) {
  for (auto &backend : backends) {
    add(std::move(backend));
  }
}

void MultiObserver::add(std::shared_ptr<IObserver> backend) {
  if (backend == nullptr || std::find(backends_.begin(), backends_.end(), backend) != backends_.end()) {
    return;
  }
  backends_.push_back(std::move(backend));
}

std::vector<std::string> MultiObserver::backend_names() const {
  std::vector<std::string> names;
  names.reserve(backends_.size());
  for (const auto &backend : backends_) {
    names.emplace_back(backend->name());
  }
  return names;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_backend([&event](IObserver &backend) { backend.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_backend([&metric](IObserver &backend) { backend.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_backend([](IObserver &backend) { backend.flush(); });
}

} // namespace toolshield::observability
