#include "toolshield/security/sanitizer.hpp"

#include "toolshield/security/detection.hpp"

#include <algorithm>
#include <iterator>

namespace toolshield::security {

namespace {

void append_warnings(std::vector<std::string> &target, std::vector<std::string> &&source) {
  target.insert(target.end(), std::make_move_iterator(source.begin()),
                std::make_move_iterator(source.end()));
}

void append_new_warnings(std::vector<std::string> &target, std::vector<std::string> &&source) {
  for (auto &warning : source) {
    if (std::find(target.begin(), target.end(), warning) == target.end()) {
      target.push_back(std::move(warning));
    }
  }
}

} // namespace

BasicSanitizer::BasicSanitizer(SanitizeOptions options) : options_(options) {}

SanitizeResult BasicSanitizer::sanitize(const trust::Payload &payload) const {
  const std::string *text = payload.as_text();
  if (text == nullptr) {
    return SanitizeResult{payload, {}};
  }

  std::vector<std::string> warnings;

  auto stage = normalize_text(*text);
  append_warnings(warnings, std::move(stage.warnings));

  const std::string normalized = stage.text;
  stage = remove_control_characters(normalized);
  append_warnings(warnings, std::move(stage.warnings));
  if (stage.text != normalized) {
    // Dropping a zero-width character can put a base letter next to a combining mark.
    auto renormalized = normalize_text(stage.text);
    stage.text = std::move(renormalized.text);
    append_new_warnings(warnings, std::move(renormalized.warnings));
  }

  // A placeholder can open a word boundary in front of a phrase that an earlier rule could
  // not see ("%41DAN" becomes "[FILTERED]DAN"), so the filters repeat until a round changes
  // nothing. Matches never split a placeholder and every change consumes input text, which
  // bounds the rounds by the text length.
  const std::size_t max_rounds = stage.text.size() + 1;
  for (std::size_t round = 0; round < max_rounds; ++round) {
    const std::string before = stage.text;

    stage = filter_prompt_injection(stage.text);
    append_warnings(warnings, std::move(stage.warnings));

    stage = filter_jailbreak_attempts(stage.text);
    append_warnings(warnings, std::move(stage.warnings));

    if (options_.filter_encodings) {
      stage = detect_hidden_encoding(stage.text, true);
      append_warnings(warnings, std::move(stage.warnings));
    }

    if (stage.text == before) {
      break;
    }
  }

  if (!options_.filter_encodings) {
    stage = detect_hidden_encoding(stage.text, false);
    append_warnings(warnings, std::move(stage.warnings));
  }

  return SanitizeResult{trust::Payload::text(std::move(stage.text)), std::move(warnings)};
}

SanitizerChain::SanitizerChain(std::vector<std::shared_ptr<const ISanitizer>> stages) {
  for (auto &stage : stages) {
    add(std::move(stage));
  }
}

void SanitizerChain::add(std::shared_ptr<const ISanitizer> stage) {
  if (stage != nullptr) {
    stages_.push_back(std::move(stage));
  }
}

SanitizeResult SanitizerChain::sanitize(const trust::Payload &payload) const {
  SanitizeResult result{payload, {}};
  for (const auto &stage : stages_) {
    auto next = stage->sanitize(result.payload);
    result.payload = std::move(next.payload);
    append_warnings(result.warnings, std::move(next.warnings));
  }
  return result;
}

FunctionSanitizer::FunctionSanitizer(std::string name, Fn fn)
    : name_(std::move(name)), fn_(std::move(fn)) {}

SanitizeResult FunctionSanitizer::sanitize(const trust::Payload &payload) const {
  if (!fn_) {
    return SanitizeResult{payload, {}};
  }
  return fn_(payload);
}

std::shared_ptr<const ISanitizer> default_sanitizer() {
  static const std::shared_ptr<const ISanitizer> instance = std::make_shared<BasicSanitizer>();
  return instance;
}

std::shared_ptr<const ISanitizer> make_basic_sanitizer(const SanitizeOptions options) {
  return std::make_shared<BasicSanitizer>(options);
}

} // namespace toolshield::security
