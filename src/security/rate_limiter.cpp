#include "toolshield/security/rate_limiter.hpp"

#include <algorithm>

namespace toolshield::security {

std::string describe_rate_limit(const RateLimit &limit) {
  const auto ms = limit.period.count();
  const std::string period =
      (ms % 1000 == 0) ? std::to_string(ms / 1000) + "s" : std::to_string(ms) + "ms";
  return std::to_string(limit.max_calls) + " calls per " + period;
}

RateLimiter::RateLimiter(Clock clock) : clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point RateLimiter::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void RateLimiter::prune_locked(Window &window, const std::chrono::steady_clock::time_point now) {
  // A call stops counting exactly `period` after it was admitted.
  const auto cutoff = now - window.limit.period;
  window.calls.erase(std::remove_if(window.calls.begin(), window.calls.end(),
                                    [cutoff](const auto &t) { return t <= cutoff; }),
                     window.calls.end());
}

std::shared_ptr<RateLimiter::Window> RateLimiter::window_for(const std::string &tool_id,
                                                             const RateLimit &limit) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = windows_[tool_id];
  if (slot == nullptr) {
    slot = std::make_shared<Window>();
    slot->limit = limit;
  }
  return slot;
}

std::shared_ptr<RateLimiter::Window> RateLimiter::find_window(const std::string &tool_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto it = windows_.find(tool_id);
  return it == windows_.end() ? nullptr : it->second;
}

bool RateLimiter::try_acquire(const std::string &tool_id, const RateLimit &limit) {
  return try_acquire_at(tool_id, limit, now());
}

bool RateLimiter::try_acquire_at(const std::string &tool_id, const RateLimit &limit,
                                 const std::chrono::steady_clock::time_point now) {
  const auto window = window_for(tool_id, limit);
  std::lock_guard<std::mutex> lock(window->mutex);
  if (window->limit.period <= std::chrono::milliseconds::zero()) {
    return false;
  }
  prune_locked(*window, now);
  if (window->calls.size() >= static_cast<std::size_t>(window->limit.max_calls)) {
    return false;
  }
  window->calls.push_back(now);
  return true;
}

std::size_t RateLimiter::count(const std::string &tool_id) { return count_at(tool_id, now()); }

std::size_t RateLimiter::count_at(const std::string &tool_id,
                                  const std::chrono::steady_clock::time_point now) {
  const auto window = find_window(tool_id);
  if (window == nullptr) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(window->mutex);
  prune_locked(*window, now);
  return window->calls.size();
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  windows_.clear();
}

} // namespace toolshield::security
