#pragma once

#include "toolshield/security/normalizer.hpp"

#include <string>
#include <vector>

namespace toolshield::security {

extern const std::string WARNING_CONTROL_CHARACTERS_REMOVED;

// Each stage consumes the previous stage's output and never decodes what it finds.

/// Drops problem characters and Cc code points other than tab, newline, carriage return.
[[nodiscard]] TextResult remove_control_characters(const std::string &text);
[[nodiscard]] bool contains_control_characters(const std::string &text);

/// One warning per injection rule that matched; every match of that rule is replaced.
[[nodiscard]] TextResult filter_prompt_injection(const std::string &text);
[[nodiscard]] TextResult filter_jailbreak_attempts(const std::string &text);

/// Warn-only mode stops at the first matching rule; filter mode evaluates every rule.
[[nodiscard]] TextResult detect_hidden_encoding(const std::string &text, bool filter_encoded);

/// Labels of every injection and jailbreak rule matching `text`. Does not modify anything.
[[nodiscard]] std::vector<std::string> detect_threats(const std::string &text);

} // namespace toolshield::security
