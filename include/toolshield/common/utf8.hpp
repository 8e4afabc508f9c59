#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace toolshield::common {

struct Utf8Step {
  std::uint32_t codepoint = 0;
  std::size_t length = 1;
  // False for a malformed sequence; `length` is then 1 and `codepoint` the raw byte.
  bool valid = true;
};

/// Decodes one code point at `index` (RFC 3629: no overlongs, surrogates or > U+10FFFF).
[[nodiscard]] Utf8Step decode_utf8_at(std::string_view input, std::size_t index);

void append_utf8(std::string &out, std::uint32_t codepoint);

[[nodiscard]] bool is_valid_utf8(std::string_view input);

} // namespace toolshield::common
