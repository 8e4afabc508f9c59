#pragma once

#include "toolshield/trust/trust_level.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolshield::observability {

struct SanitizationEvent {
  std::string sanitizer;
  std::vector<std::string> warnings;
  trust::TrustLevel prior = trust::TrustLevel::Untrusted;
  trust::TrustLevel result = trust::TrustLevel::Untrusted;
};

struct RejectionEvent {
  std::string layer;
  std::string reason;
};

struct RateLimitEvent {
  std::string tool;
  bool admitted = false;
  std::size_t in_window = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SanitizationEvent, RejectionEvent, RateLimitEvent, ErrorEvent>;

struct SanitizeLatencyMetric {
  std::chrono::microseconds latency{0};
};

using ObserverMetric = std::variant<SanitizeLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace toolshield::observability
