#include "toolshield/config/config.hpp"

#include "toolshield/common/fs.hpp"
#include "toolshield/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace toolshield::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".toolshield";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::uint64_t ONE_DAY_SECONDS = 24ULL * 60ULL * 60ULL;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TOOLSHIELD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::optional<bool> parse_env_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_env_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

bool is_known_backend(const std::string &backend) {
  return backend == "none" || backend == "noop" || backend == "log";
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *raw = env_value("TOOLSHIELD_FILTER_ENCODINGS"); raw != nullptr) {
    if (const auto value = parse_env_bool(raw); value.has_value()) {
      config.sanitizer.filter_encodings = *value;
    }
  }

  if (const char *raw = env_value("TOOLSHIELD_RATE_LIMIT_MAX_CALLS"); raw != nullptr) {
    const auto value = parse_env_u64(raw);
    if (value.has_value() && *value <= std::numeric_limits<std::uint32_t>::max()) {
      config.rate_limit.max_calls = static_cast<std::uint32_t>(*value);
    }
  }

  if (const char *raw = env_value("TOOLSHIELD_RATE_LIMIT_PERIOD_SECONDS"); raw != nullptr) {
    if (const auto value = parse_env_u64(raw); value.has_value()) {
      config.rate_limit.period_seconds = *value;
    }
  }

  if (const char *raw = env_value("TOOLSHIELD_OBSERVABILITY"); raw != nullptr) {
    config.observability.backend = common::trim(raw);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  if (doc.has("sanitizer.filter_encodings")) {
    const auto value = doc.get_bool("sanitizer.filter_encodings");
    if (!value.ok()) {
      return common::Result<Config>::failure(value.error());
    }
    config.sanitizer.filter_encodings = value.value();
  }

  if (doc.has("rate_limit.max_calls")) {
    const auto value = doc.get_u64("rate_limit.max_calls");
    if (!value.ok()) {
      return common::Result<Config>::failure(value.error());
    }
    if (value.value() > std::numeric_limits<std::uint32_t>::max()) {
      return common::Result<Config>::failure("rate_limit.max_calls is out of range");
    }
    config.rate_limit.max_calls = static_cast<std::uint32_t>(value.value());
  }

  if (doc.has("rate_limit.period_seconds")) {
    const auto value = doc.get_u64("rate_limit.period_seconds");
    if (!value.ok()) {
      return common::Result<Config>::failure(value.error());
    }
    config.rate_limit.period_seconds = value.value();
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[sanitizer]\n";
  out << "filter_encodings = " << bool_to_toml(config.sanitizer.filter_encodings) << "\n";
  out << "\n[rate_limit]\n";
  out << "max_calls = " << config.rate_limit.max_calls << "\n";
  out << "period_seconds = " << config.rate_limit.period_seconds << "\n";
  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.rate_limit.max_calls == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rate_limit.max_calls must be at least 1");
  }
  if (config.rate_limit.period_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rate_limit.period_seconds must be at least 1");
  }
  if (config.rate_limit.period_seconds > ONE_DAY_SECONDS) {
    warnings.push_back("rate_limit.period_seconds exceeds one day; windows are not persisted");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty()) {
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string name = common::trim(part);
      if (!is_known_backend(name)) {
        return common::Result<std::vector<std::string>>::failure(
            "Invalid observability.backend: " + config.observability.backend);
      }
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

security::SanitizeOptions to_sanitize_options(const Config &config) {
  return security::SanitizeOptions{.filter_encodings = config.sanitizer.filter_encodings};
}

security::RateLimit to_rate_limit(const Config &config) {
  return security::RateLimit{
      .max_calls = config.rate_limit.max_calls,
      .period = std::chrono::seconds(config.rate_limit.period_seconds)};
}

} // namespace toolshield::config
