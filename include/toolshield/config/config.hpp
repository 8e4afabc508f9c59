#pragma once

#include "toolshield/common/result.hpp"
#include "toolshield/config/schema.hpp"
#include "toolshield/security/rate_limiter.hpp"
#include "toolshield/security/sanitizer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolshield::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then the config file (if present), then environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Applies a TOML document on top of the defaults. No environment lookups.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] security::SanitizeOptions to_sanitize_options(const Config &config);
[[nodiscard]] security::RateLimit to_rate_limit(const Config &config);

} // namespace toolshield::config
