#pragma once

#include <cstdint>
#include <string>

namespace toolshield::config {

struct SanitizerConfig {
  bool filter_encodings = false;
};

struct RateLimitConfig {
  std::uint32_t max_calls = 10;
  std::uint64_t period_seconds = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SanitizerConfig sanitizer;
  RateLimitConfig rate_limit;
  ObservabilityConfig observability;
};

} // namespace toolshield::config
