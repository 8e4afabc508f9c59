#pragma once

#include "toolshield/security/normalizer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace toolshield::security {

struct SanitizeOptions {
  bool filter_encodings = false;
};

class ISanitizer {
public:
  virtual ~ISanitizer() = default;

  [[nodiscard]] virtual SanitizeResult sanitize(const trust::Payload &payload) const = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// The default pipeline: normalization, control scrubbing, injection filtering, jailbreak
/// filtering, encoding detection. Running it over its own output changes nothing.
class BasicSanitizer final : public ISanitizer {
public:
  explicit BasicSanitizer(SanitizeOptions options = {});

  [[nodiscard]] SanitizeResult sanitize(const trust::Payload &payload) const override;
  [[nodiscard]] std::string_view name() const override { return "basic"; }

  [[nodiscard]] const SanitizeOptions &options() const { return options_; }

private:
  SanitizeOptions options_;
};

/// Runs inner sanitizers in insertion order, each on the previous one's output.
class SanitizerChain final : public ISanitizer {
public:
  SanitizerChain() = default;
  explicit SanitizerChain(std::vector<std::shared_ptr<const ISanitizer>> stages);

  void add(std::shared_ptr<const ISanitizer> stage);
  [[nodiscard]] std::size_t size() const { return stages_.size(); }

  [[nodiscard]] SanitizeResult sanitize(const trust::Payload &payload) const override;
  [[nodiscard]] std::string_view name() const override { return "chain"; }

private:
  std::vector<std::shared_ptr<const ISanitizer>> stages_;
};

/// Adapts a plain callable, e.g. a lambda binding custom options.
class FunctionSanitizer final : public ISanitizer {
public:
  using Fn = std::function<SanitizeResult(const trust::Payload &)>;

  FunctionSanitizer(std::string name, Fn fn);

  [[nodiscard]] SanitizeResult sanitize(const trust::Payload &payload) const override;
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::string name_;
  Fn fn_;
};

/// Shared BasicSanitizer with default options.
[[nodiscard]] std::shared_ptr<const ISanitizer> default_sanitizer();

[[nodiscard]] std::shared_ptr<const ISanitizer> make_basic_sanitizer(SanitizeOptions options);

} // namespace toolshield::security
