#pragma once

#include "toolshield/observability/observer.hpp"

#include <memory>

namespace toolshield::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
/// Snapshot of the current observer; stays valid after a concurrent replacement.
std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sanitization(const std::string &sanitizer, const std::vector<std::string> &warnings,
                         trust::TrustLevel prior, trust::TrustLevel result);
void record_rejection(const std::string &layer, const std::string &reason);
void record_rate_limit(const std::string &tool, bool admitted, std::size_t in_window);
void record_error(const std::string &component, const std::string &message);

} // namespace toolshield::observability
