#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolshield::security {

enum class RuleCategory { Injection, Jailbreak, Encoding };

/// Half-open byte range `[begin, end)` of one match.
struct MatchSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
};

/// Leftmost match starting at or after `from`. Scanners walk the text once and never recurse,
/// so they replace regexes whose repetition is unbounded.
using RunScanner = std::optional<MatchSpan> (*)(std::string_view text, std::size_t from);

struct DetectionRule {
  std::string label;
  RuleCategory category;
  std::regex regex;
  RunScanner scanner = nullptr;
  std::string replacement;
};

extern const std::string FILTERED_PLACEHOLDER;

[[nodiscard]] std::string rule_category_label(RuleCategory category);

/// Rules of one category in evaluation order. Compiled on first use, read-only afterwards.
[[nodiscard]] const std::vector<DetectionRule> &detection_rules(RuleCategory category);

[[nodiscard]] bool rule_matches(const DetectionRule &rule, const std::string &text);

/// Every non-overlapping match of `rule`, left to right, replaced with its placeholder.
[[nodiscard]] std::string rule_replace(const DetectionRule &rule, const std::string &text);

/// Code point -> ASCII replacement for glyphs that imitate Latin letters.
[[nodiscard]] const std::unordered_map<std::uint32_t, char> &confusables_table();

/// Zero-width, bidi-control, filler and deprecated format characters.
[[nodiscard]] bool is_problem_character(std::uint32_t codepoint);

} // namespace toolshield::security
