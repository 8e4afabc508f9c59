#include "toolshield/security/normalizer.hpp"

#include "toolshield/common/result.hpp"
#include "toolshield/common/utf8.hpp"
#include "toolshield/observability/global.hpp"
#include "toolshield/security/patterns.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <cstdint>
#include <limits>

namespace toolshield::security {

const std::string WARNING_CONFUSABLES_REPLACED = "confusable characters replaced";

namespace {

TextResult stage_failure(const std::string &text, const std::string &stage,
                         const std::string &reason) {
  observability::record_error("normalizer", "stage '" + stage + "' failed: " + reason);
  return TextResult{text, {"normalization failed at stage '" + stage + "': " + reason}};
}

common::Result<std::string> apply_nfkc(const std::string &text) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || nfkc == nullptr) {
    return common::Result<std::string>::failure(u_errorName(status));
  }

  const icu::UnicodeString source = icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
  const icu::UnicodeString normalized = nfkc->normalize(source, status);
  if (U_FAILURE(status)) {
    return common::Result<std::string>::failure(u_errorName(status));
  }

  std::string folded;
  normalized.toUTF8String(folded);
  return common::Result<std::string>::success(std::move(folded));
}

} // namespace

TextResult replace_confusables(const std::string &text) {
  const auto &table = confusables_table();
  std::string output;
  output.reserve(text.size());
  bool replaced = false;

  std::size_t index = 0;
  while (index < text.size()) {
    const auto step = common::decode_utf8_at(text, index);
    if (step.valid) {
      if (const auto it = table.find(step.codepoint); it != table.end()) {
        output.push_back(it->second);
        replaced = true;
        index += step.length;
        continue;
      }
    }
    output.append(text, index, step.length);
    index += step.length;
  }

  if (!replaced) {
    return TextResult{text, {}};
  }
  return TextResult{std::move(output), {WARNING_CONFUSABLES_REPLACED}};
}

TextResult normalize_text(const std::string &text) {
  if (!common::is_valid_utf8(text)) {
    return stage_failure(text, "nfkc", "input is not valid UTF-8");
  }
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return stage_failure(text, "nfkc", "input too large");
  }

  // A replaced confusable can compose with the mark after it ("а" + U+0301 becomes "á"), so
  // both steps repeat until replacement finds nothing. Every repeat removes a non-ASCII code
  // point, which bounds the loop.
  std::string current = text;
  bool replaced = false;
  while (true) {
    auto folded = apply_nfkc(current);
    if (!folded.ok()) {
      return stage_failure(text, "nfkc", folded.error());
    }
    auto mapped = replace_confusables(folded.value());
    current = std::move(mapped.text);
    if (mapped.warnings.empty()) {
      break;
    }
    replaced = true;
  }

  if (!replaced) {
    return TextResult{std::move(current), {}};
  }
  return TextResult{std::move(current), {WARNING_CONFUSABLES_REPLACED}};
}

SanitizeResult normalize(const trust::Payload &payload) {
  const std::string *text = payload.as_text();
  if (text == nullptr) {
    return SanitizeResult{payload, {}};
  }
  auto result = normalize_text(*text);
  return SanitizeResult{trust::Payload::text(std::move(result.text)), std::move(result.warnings)};
}

} // namespace toolshield::security
