#include "toolshield/security/detection.hpp"

#include "toolshield/common/utf8.hpp"
#include "toolshield/security/patterns.hpp"

#include <unicode/uchar.h>

namespace toolshield::security {

const std::string WARNING_CONTROL_CHARACTERS_REMOVED = "control characters removed";

namespace {

bool is_unsafe_codepoint(const common::Utf8Step &step) {
  if (!step.valid) {
    return false;
  }
  const std::uint32_t cp = step.codepoint;
  if (cp == '\t' || cp == '\n' || cp == '\r' || cp == ' ') {
    return false;
  }
  if (is_problem_character(cp)) {
    return true;
  }
  return u_charType(static_cast<UChar32>(cp)) == U_CONTROL_CHAR;
}

TextResult filter_with_rules(const std::string &text, const RuleCategory category,
                             const std::string &warning_prefix) {
  TextResult result{text, {}};
  for (const auto &rule : detection_rules(category)) {
    if (!rule_matches(rule, result.text)) {
      continue;
    }
    result.warnings.push_back(warning_prefix + ": matched '" + rule.label + "'");
    result.text = rule_replace(rule, result.text);
  }
  return result;
}

} // namespace

TextResult remove_control_characters(const std::string &text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  bool removed = false;

  std::size_t index = 0;
  while (index < text.size()) {
    const auto step = common::decode_utf8_at(text, index);
    if (is_unsafe_codepoint(step)) {
      removed = true;
    } else {
      cleaned.append(text, index, step.length);
    }
    index += step.length;
  }

  if (!removed) {
    return TextResult{text, {}};
  }
  return TextResult{std::move(cleaned), {WARNING_CONTROL_CHARACTERS_REMOVED}};
}

bool contains_control_characters(const std::string &text) {
  std::size_t index = 0;
  while (index < text.size()) {
    const auto step = common::decode_utf8_at(text, index);
    if (is_unsafe_codepoint(step)) {
      return true;
    }
    index += step.length;
  }
  return false;
}

TextResult filter_prompt_injection(const std::string &text) {
  return filter_with_rules(text, RuleCategory::Injection, "potential prompt injection filtered");
}

TextResult filter_jailbreak_attempts(const std::string &text) {
  return filter_with_rules(text, RuleCategory::Jailbreak, "potential jailbreak attempt filtered");
}

TextResult detect_hidden_encoding(const std::string &text, const bool filter_encoded) {
  TextResult result{text, {}};
  for (const auto &rule : detection_rules(RuleCategory::Encoding)) {
    if (!rule_matches(rule, result.text)) {
      continue;
    }

    std::string warning = "potentially encoded content detected: matched '" + rule.label + "'; ";
    if (!filter_encoded) {
      result.warnings.push_back(warning + "manual review recommended");
      break;
    }
    result.text = rule_replace(rule, result.text);
    result.warnings.push_back(warning + "content filtered");
  }
  return result;
}

std::vector<std::string> detect_threats(const std::string &text) {
  std::vector<std::string> matches;
  for (const auto category : {RuleCategory::Injection, RuleCategory::Jailbreak}) {
    for (const auto &rule : detection_rules(category)) {
      if (rule_matches(rule, text)) {
        matches.push_back(rule.label);
      }
    }
  }
  return matches;
}

} // namespace toolshield::security
