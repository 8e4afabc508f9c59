#pragma once

#include "toolshield/trust/envelope.hpp"

#include <string>
#include <vector>

namespace toolshield::security {

extern const std::string WARNING_CONFUSABLES_REPLACED;

/// Output of a single text stage.
struct TextResult {
  std::string text;
  std::vector<std::string> warnings;
};

/// Applies Unicode NFKC, then maps confusable glyphs to their Latin equivalents, until the
/// output is stable under both. Malformed input is returned unchanged with one warning naming
/// the failed stage, and the failure is recorded as an ErrorEvent.
[[nodiscard]] TextResult normalize_text(const std::string &text);

/// Replaces confusable code points only. Invalid UTF-8 bytes are copied through.
[[nodiscard]] TextResult replace_confusables(const std::string &text);

/// Output of a payload-level stage or of a whole sanitizer.
struct SanitizeResult {
  trust::Payload payload;
  std::vector<std::string> warnings;
};

/// Non-text payloads pass through without warnings.
[[nodiscard]] SanitizeResult normalize(const trust::Payload &payload);

} // namespace toolshield::security
