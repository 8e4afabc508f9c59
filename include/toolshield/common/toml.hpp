#pragma once

#include "toolshield/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace toolshield::common {

/// Flat view of a TOML document: `[section]` keys are stored as `section.key`.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] Result<bool> get_bool(const std::string &key) const;
  [[nodiscard]] Result<std::uint64_t> get_u64(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace toolshield::common
