#pragma once

#include <string>
#include <vector>

namespace toolshield::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Render a JSON array of strings.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace toolshield::common
