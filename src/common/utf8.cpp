#include "toolshield/common/utf8.hpp"

namespace toolshield::common {

namespace {

Utf8Step invalid_byte(const std::string_view input, const std::size_t index) {
  return Utf8Step{static_cast<unsigned char>(input[index]), 1, false};
}

} // namespace

Utf8Step decode_utf8_at(const std::string_view input, const std::size_t index) {
  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    return Utf8Step{lead, 1, true};
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  std::uint32_t minimum = 0;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    extra = 1;
    value = lead & 0x1FU;
    minimum = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
    minimum = 0x800U;
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    extra = 3;
    value = lead & 0x07U;
    minimum = 0x10000U;
  } else {
    return invalid_byte(input, index);
  }

  if (index + extra >= input.size()) {
    return invalid_byte(input, index);
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      return invalid_byte(input, index);
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }

  if (value < minimum || value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) {
    return invalid_byte(input, index);
  }

  return Utf8Step{value, extra + 1, true};
}

void append_utf8(std::string &out, const std::uint32_t codepoint) {
  if (codepoint < 0x80U) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
    out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
  } else if (codepoint < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (codepoint >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((codepoint >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
  }
}

bool is_valid_utf8(const std::string_view input) {
  std::size_t index = 0;
  while (index < input.size()) {
    const auto step = decode_utf8_at(input, index);
    if (!step.valid) {
      return false;
    }
    index += step.length;
  }
  return true;
}

} // namespace toolshield::common
