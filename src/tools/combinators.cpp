#include "toolshield/tools/combinators.hpp"

#include "toolshield/observability/global.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace toolshield::tools {

const std::string WARNING_SANITIZATION_SKIPPED = "sanitization explicitly skipped";
const std::string WARNING_INPUT_VALIDATION_FAILED = "input validation failed";

namespace {

/// Runs `transform` on the inner result when the caller asks for it.
template <typename Fn>
std::future<trust::ToolOutcome> then(std::future<trust::ToolOutcome> inner, Fn transform) {
  return std::async(std::launch::deferred,
                    [inner = std::move(inner), transform = std::move(transform)]() mutable {
                      return trust::ToolOutcome(transform(inner.get()));
                    });
}

trust::ToolOutcome rejection(const std::string &layer, const std::string &reason) {
  observability::record_rejection(layer, reason);
  return trust::Envelope(trust::Payload::none(), trust::TrustLevel::Untrusted, {reason});
}

trust::ToolOutcome wrap_raw(trust::ToolOutcome outcome, const trust::TrustLevel level) {
  if (std::holds_alternative<trust::Envelope>(outcome)) {
    return outcome;
  }
  return trust::Envelope(std::move(std::get<trust::Payload>(outcome)), level);
}

trust::Envelope sanitize_outcome(trust::ToolOutcome outcome,
                                 const security::ISanitizer *sanitizer) {
  trust::Payload data;
  auto prior = trust::TrustLevel::Untrusted;
  std::vector<std::string> warnings;
  if (auto *envelope = std::get_if<trust::Envelope>(&outcome); envelope != nullptr) {
    data = envelope->data();
    prior = envelope->trust_level();
    warnings = envelope->warnings();
  } else {
    data = std::move(std::get<trust::Payload>(outcome));
  }

  if (sanitizer == nullptr) {
    warnings.push_back(WARNING_SANITIZATION_SKIPPED);
    observability::record_sanitization("none", {WARNING_SANITIZATION_SKIPPED}, prior, prior);
    return trust::Envelope(std::move(data), prior, std::move(warnings));
  }

  const auto started = std::chrono::steady_clock::now();
  auto result = sanitizer->sanitize(data);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  observability::record_metric(observability::SanitizeLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::microseconds>(elapsed)});

  const auto level = trust::downgrade(prior, result.warnings);
  if (!result.warnings.empty()) {
    observability::record_sanitization(std::string(sanitizer->name()), result.warnings, prior,
                                       level);
  }
  warnings.insert(warnings.end(), result.warnings.begin(), result.warnings.end());
  return trust::Envelope(std::move(result.payload), level, std::move(warnings));
}

} // namespace

std::future<trust::ToolOutcome> ready(trust::ToolOutcome outcome) {
  std::promise<trust::ToolOutcome> promise;
  promise.set_value(std::move(outcome));
  return promise.get_future();
}

ToolCall make_tool_call(std::function<trust::ToolOutcome(const ToolArgs &)> fn) {
  return [fn = std::move(fn)](const ToolArgs &args) {
    std::promise<trust::ToolOutcome> promise;
    try {
      promise.set_value(fn(args));
    } catch (...) {
      promise.set_exception(std::current_exception());
    }
    return promise.get_future();
  };
}

ToolCall mark_trusted(ToolCall inner) {
  return [inner = std::move(inner)](const ToolArgs &args) {
    return then(inner(args), [](trust::ToolOutcome outcome) {
      return wrap_raw(std::move(outcome), trust::TrustLevel::Trusted);
    });
  };
}

ToolCall mark_untrusted(ToolCall inner) {
  return [inner = std::move(inner)](const ToolArgs &args) {
    return then(inner(args), [](trust::ToolOutcome outcome) {
      return wrap_raw(std::move(outcome), trust::TrustLevel::Untrusted);
    });
  };
}

ToolCall sanitize(ToolCall inner, std::shared_ptr<const security::ISanitizer> sanitizer) {
  return [inner = std::move(inner), sanitizer = std::move(sanitizer)](const ToolArgs &args) {
    return then(inner(args), [sanitizer](trust::ToolOutcome outcome) {
      return sanitize_outcome(std::move(outcome), sanitizer.get());
    });
  };
}

ToolCall validate_inputs(ToolCall inner, Validator validator) {
  return [inner = std::move(inner), validator = std::move(validator)](const ToolArgs &args) {
    if (!validator || !validator(args)) {
      return ready(rejection("validate_inputs", WARNING_INPUT_VALIDATION_FAILED));
    }
    return then(inner(args), [](trust::ToolOutcome outcome) {
      return wrap_raw(std::move(outcome), trust::TrustLevel::Untrusted);
    });
  };
}

ToolCall rate_limited(ToolCall inner, std::shared_ptr<security::RateLimiter> limiter,
                      std::string tool_id, security::RateLimit limit) {
  return [inner = std::move(inner), limiter = std::move(limiter), tool_id = std::move(tool_id),
          limit](const ToolArgs &args) {
    const bool admitted = limiter->try_acquire(tool_id, limit);
    observability::record_rate_limit(tool_id, admitted, limiter->count(tool_id));
    if (!admitted) {
      return ready(rejection("rate_limited", "rate limit exceeded: " +
                                                 security::describe_rate_limit(limit)));
    }
    return then(inner(args), [](trust::ToolOutcome outcome) {
      return wrap_raw(std::move(outcome), trust::TrustLevel::Untrusted);
    });
  };
}

Combinator trusted_layer() {
  return [](ToolCall inner) { return mark_trusted(std::move(inner)); };
}

Combinator untrusted_layer() {
  return [](ToolCall inner) { return mark_untrusted(std::move(inner)); };
}

Combinator sanitize_layer(std::shared_ptr<const security::ISanitizer> sanitizer) {
  return [sanitizer = std::move(sanitizer)](ToolCall inner) {
    return sanitize(std::move(inner), sanitizer);
  };
}

Combinator validate_layer(Validator validator) {
  return [validator = std::move(validator)](ToolCall inner) {
    return validate_inputs(std::move(inner), validator);
  };
}

Combinator rate_limit_layer(std::shared_ptr<security::RateLimiter> limiter, std::string tool_id,
                            security::RateLimit limit) {
  return [limiter = std::move(limiter), tool_id = std::move(tool_id), limit](ToolCall inner) {
    return rate_limited(std::move(inner), limiter, tool_id, limit);
  };
}

ToolCall stack(ToolCall call, std::initializer_list<Combinator> layers) {
  return stack(std::move(call), std::vector<Combinator>(layers));
}

ToolCall stack(ToolCall call, const std::vector<Combinator> &layers) {
  for (const auto &layer : layers) {
    call = layer(std::move(call));
  }
  return call;
}

} // namespace toolshield::tools
