#pragma once

#include "toolshield/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolshield::observability {

/// Forwards every event and metric to its backends in the order they were added. A backend
/// may also be installed elsewhere (for example as the global observer).
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::shared_ptr<IObserver>> backends);

  /// Ignores null backends and backends that are already present.
  void add(std::shared_ptr<IObserver> backend);
  [[nodiscard]] std::size_t size() const { return backends_.size(); }
  [[nodiscard]] std::vector<std::string> backend_names() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each_backend(Fn &&fn) {
    for (const auto &backend : backends_) {
      fn(*backend);
    }
  }

  std::vector<std::shared_ptr<IObserver>> backends_;
};

} // namespace toolshield::observability
