#include "toolshield/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace toolshield::observability {

namespace {

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += "; ";
    }
    out += values[i];
  }
  return out;
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SanitizationEvent>) {
          const std::string level = evt.warnings.empty() ? "DEBUG" : "WARN";
          log_line(level, "sanitize sanitizer=" + evt.sanitizer +
                              " trust=" + trust::trust_level_to_string(evt.prior) + "->" +
                              trust::trust_level_to_string(evt.result) +
                              " warnings=" + std::to_string(evt.warnings.size()) +
                              (evt.warnings.empty() ? "" : " [" + join(evt.warnings) + "]"));
        } else if constexpr (std::is_same_v<T, RejectionEvent>) {
          log_line("WARN", "rejected layer=" + evt.layer + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, RateLimitEvent>) {
          log_line(evt.admitted ? "DEBUG" : "WARN",
                   "rate_limit tool=" + evt.tool + " admitted=" +
                       (evt.admitted ? std::string("true") : std::string("false")) +
                       " in_window=" + std::to_string(evt.in_window));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SanitizeLatencyMetric>) {
          log_line("DEBUG", "metric.sanitize_latency_us=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace toolshield::observability
