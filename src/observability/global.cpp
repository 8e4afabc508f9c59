#include "toolshield/observability/global.hpp"

#include <mutex>

namespace toolshield::observability {

namespace {

std::mutex g_observer_mutex;
// Readers take a copy, so an observer replaced mid-call lives until that call is done.
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_sanitization(const std::string &sanitizer, const std::vector<std::string> &warnings,
                         const trust::TrustLevel prior, const trust::TrustLevel result) {
  record_event(SanitizationEvent{
      .sanitizer = sanitizer, .warnings = warnings, .prior = prior, .result = result});
}

void record_rejection(const std::string &layer, const std::string &reason) {
  record_event(RejectionEvent{.layer = layer, .reason = reason});
}

void record_rate_limit(const std::string &tool, const bool admitted, const std::size_t in_window) {
  record_event(RateLimitEvent{.tool = tool, .admitted = admitted, .in_window = in_window});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace toolshield::observability
