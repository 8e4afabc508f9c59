#pragma once

#include "toolshield/common/result.hpp"

#include <filesystem>
#include <string>

namespace toolshield::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Expands a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(std::string value);

/// Reads a whole file; fails when it cannot be opened.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes through a sibling `.tmp` file and renames it into place.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace toolshield::common
