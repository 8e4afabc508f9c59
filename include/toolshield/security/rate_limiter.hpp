#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolshield::security {

struct RateLimit {
  std::uint32_t max_calls = 10;
  std::chrono::milliseconds period{std::chrono::seconds(60)};
};

/// "2 calls per 60s" / "5 calls per 250ms".
[[nodiscard]] std::string describe_rate_limit(const RateLimit &limit);

/// Sliding-window call counter keyed by tool identity. One instance is owned by the host
/// and shared by every rate-limited tool call. Each tool has its own window and lock; the
/// registry lock is only taken to find or create a window.
class RateLimiter {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit RateLimiter(Clock clock = {});

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  /// Prunes, checks and records in one step. A rejected call leaves no timestamp behind.
  /// The limit of the first call for `tool_id` sticks for the window's lifetime. A limit with
  /// no calls or no period rejects everything.
  [[nodiscard]] bool try_acquire(const std::string &tool_id, const RateLimit &limit);
  [[nodiscard]] bool try_acquire_at(const std::string &tool_id, const RateLimit &limit,
                                    std::chrono::steady_clock::time_point now);

  /// Calls still inside the window; 0 for tools never seen.
  [[nodiscard]] std::size_t count(const std::string &tool_id);
  [[nodiscard]] std::size_t count_at(const std::string &tool_id,
                                     std::chrono::steady_clock::time_point now);

  void reset();

  [[nodiscard]] std::chrono::steady_clock::time_point now() const;

private:
  struct Window {
    std::mutex mutex;
    RateLimit limit;
    std::vector<std::chrono::steady_clock::time_point> calls;
  };

  std::shared_ptr<Window> window_for(const std::string &tool_id, const RateLimit &limit);
  std::shared_ptr<Window> find_window(const std::string &tool_id);
  static void prune_locked(Window &window, std::chrono::steady_clock::time_point now);

  Clock clock_;
  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Window>> windows_;
};

} // namespace toolshield::security
