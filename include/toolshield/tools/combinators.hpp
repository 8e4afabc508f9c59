#pragma once

#include "toolshield/security/rate_limiter.hpp"
#include "toolshield/security/sanitizer.hpp"
#include "toolshield/trust/envelope.hpp"

#include <functional>
#include <future>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolshield::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

/// An asynchronous tool invocation. Layers wrap one ToolCall into another.
using ToolCall = std::function<std::future<trust::ToolOutcome>(const ToolArgs &)>;
using Combinator = std::function<ToolCall(ToolCall)>;
using Validator = std::function<bool(const ToolArgs &)>;

extern const std::string WARNING_SANITIZATION_SKIPPED;
extern const std::string WARNING_INPUT_VALIDATION_FAILED;

/// Future that is already satisfied with `outcome`.
[[nodiscard]] std::future<trust::ToolOutcome> ready(trust::ToolOutcome outcome);

/// Adapts a synchronous function. Exceptions it throws are stored in the returned future.
[[nodiscard]] ToolCall make_tool_call(std::function<trust::ToolOutcome(const ToolArgs &)> fn);

// Envelopes coming from inner layers are never nested. Each layer either passes them through
// or builds a new one from their fields, and no layer raises trust.

/// Raw results become `{data, Trusted, []}`; envelopes pass through unchanged.
[[nodiscard]] ToolCall mark_trusted(ToolCall inner);

/// Raw results become Untrusted with the default warning; envelopes pass through unchanged.
[[nodiscard]] ToolCall mark_untrusted(ToolCall inner);

/// Runs `sanitizer` over the result's data and downgrades trust when it reports anything.
/// Raw results start as Untrusted. A null sanitizer keeps the data and trust as they are and
/// adds "sanitization explicitly skipped".
[[nodiscard]] ToolCall
sanitize(ToolCall inner,
         std::shared_ptr<const security::ISanitizer> sanitizer = security::default_sanitizer());

/// Checks the arguments before `inner` runs. A rejected call never reaches `inner`.
[[nodiscard]] ToolCall validate_inputs(ToolCall inner, Validator validator);

/// Admits at most `limit.max_calls` calls per `limit.period` for `tool_id`, counted in the
/// shared `limiter`. A rejected call never reaches `inner`.
[[nodiscard]] ToolCall rate_limited(ToolCall inner, std::shared_ptr<security::RateLimiter> limiter,
                                    std::string tool_id, security::RateLimit limit);

[[nodiscard]] Combinator trusted_layer();
[[nodiscard]] Combinator untrusted_layer();
[[nodiscard]] Combinator
sanitize_layer(std::shared_ptr<const security::ISanitizer> sanitizer = security::default_sanitizer());
[[nodiscard]] Combinator validate_layer(Validator validator);
[[nodiscard]] Combinator rate_limit_layer(std::shared_ptr<security::RateLimiter> limiter,
                                          std::string tool_id, security::RateLimit limit);

/// Wraps `call` with `layers`, the first one innermost.
[[nodiscard]] ToolCall stack(ToolCall call, std::initializer_list<Combinator> layers);
[[nodiscard]] ToolCall stack(ToolCall call, const std::vector<Combinator> &layers);

} // namespace toolshield::tools
