#pragma once

#include "toolshield/trust/trust_level.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace toolshield::trust {

extern const std::string DEFAULT_UNTRUSTED_WARNING;

/// Value returned by a tool. Only text is inspected by the sanitizers; structured results
/// travel as an already serialized JSON document.
class Payload {
public:
  struct Structured {
    std::string json;
    bool operator==(const Structured &) const = default;
  };

  using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, Structured>;

  Payload() = default;

  [[nodiscard]] static Payload none() { return Payload(); }
  [[nodiscard]] static Payload boolean(bool value) { return Payload(Value(value)); }
  [[nodiscard]] static Payload integer(std::int64_t value) { return Payload(Value(value)); }
  [[nodiscard]] static Payload number(double value) { return Payload(Value(value)); }
  [[nodiscard]] static Payload text(std::string value) {
    return Payload(Value(std::in_place_type<std::string>, std::move(value)));
  }
  [[nodiscard]] static Payload structured(std::string json) {
    return Payload(Value(Structured{std::move(json)}));
  }

  [[nodiscard]] bool is_none() const { return std::holds_alternative<std::monostate>(value_); }
  [[nodiscard]] bool is_text() const { return std::holds_alternative<std::string>(value_); }

  /// nullptr unless the payload is text.
  [[nodiscard]] const std::string *as_text() const { return std::get_if<std::string>(&value_); }
  [[nodiscard]] const Value &value() const { return value_; }

  [[nodiscard]] std::string to_json() const;

  bool operator==(const Payload &) const = default;

private:
  explicit Payload(Value value) : value_(std::move(value)) {}

  Value value_;
};

/// Tool result plus its provenance. Immutable: layers build a new Envelope instead of
/// editing one. An Untrusted envelope always carries at least one warning.
class Envelope {
public:
  Envelope(Payload data, TrustLevel trust_level, std::vector<std::string> warnings = {});

  [[nodiscard]] const Payload &data() const { return data_; }
  [[nodiscard]] TrustLevel trust_level() const { return trust_level_; }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  [[nodiscard]] std::string to_json() const;

  bool operator==(const Envelope &) const = default;

private:
  Payload data_;
  TrustLevel trust_level_;
  std::vector<std::string> warnings_;
};

/// What a tool call hands back: a raw payload, or an envelope from an inner layer.
using ToolOutcome = std::variant<Payload, Envelope>;

/// Envelope for the host. Raw payloads that never met a layer are treated as Untrusted.
[[nodiscard]] Envelope finalize(ToolOutcome outcome);

} // namespace toolshield::trust
