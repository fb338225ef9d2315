#include "gembridge/config/config.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/common/toml.hpp"
#include "gembridge/gemini/deadline.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace gembridge::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".gembridge";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("GEMBRIDGE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::string> non_empty(const std::optional<std::string> &value) {
  if (!value.has_value() || common::trim(*value).empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

EnvLookup process_env() {
  return [](const std::string &name) -> std::optional<std::string> {
    if (const char *value = std::getenv(name.c_str()); value != nullptr) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
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

void apply_env_overrides(Config &config, const EnvLookup &env) {
  if (const auto bin = non_empty(env("GEMINI_BIN")); bin.has_value()) {
    config.gemini.binary = *bin;
  }

  // Out-of-range values are ignored in favour of the built-in default.
  if (const auto timeout = env("GEMINI_DEFAULT_TIMEOUT"); timeout.has_value()) {
    config.gemini.default_timeout_secs = gemini::resolve_default_timeout(timeout).count();
  }

  if (const auto model = non_empty(env("GEMINI_FORCE_MODEL")); model.has_value()) {
    config.gemini.force_model = common::trim(*model);
  }

  if (const auto backend = non_empty(env("GEMBRIDGE_LOG")); backend.has_value()) {
    config.observability.backend = common::to_lower(common::trim(*backend));
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.gemini.binary = expand_config_value(doc.get_string("gemini.binary", config.gemini.binary));
  if (doc.has("gemini.default_timeout_secs")) {
    const std::uint64_t raw = doc.get_u64("gemini.default_timeout_secs", 0);
    const auto secs = static_cast<std::int64_t>(
        std::min<std::uint64_t>(raw, static_cast<std::uint64_t>(gemini::MAX_TIMEOUT_SECS) + 1));
    config.gemini.default_timeout_secs =
        gemini::timeout_in_range(secs) ? secs : gemini::DEFAULT_TIMEOUT_SECS;
  }
  if (doc.has("gemini.force_model")) {
    config.gemini.force_model = non_empty(doc.get_string("gemini.force_model"));
  }
  config.gemini.prompt_file =
      expand_config_value(doc.get_string("gemini.prompt_file", config.gemini.prompt_file));
  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const EnvLookup &env) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    // No HOME: run on defaults rather than refusing to start.
    Config config;
    apply_env_overrides(config, env);
    return common::Result<Config>::success(std::move(config));
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config, env);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config, env);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.gemini.binary).empty()) {
    return common::Result<std::vector<std::string>>::failure("gemini.binary must not be empty");
  }

  if (!gemini::timeout_in_range(config.gemini.default_timeout_secs)) {
    return common::Result<std::vector<std::string>>::failure(
        "gemini.default_timeout_secs must be between " +
        std::to_string(gemini::MIN_TIMEOUT_SECS) + " and " +
        std::to_string(gemini::MAX_TIMEOUT_SECS));
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop" && backend != "off") {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  if (common::trim(config.gemini.prompt_file).empty()) {
    warnings.push_back("gemini.prompt_file is empty, prompt prefix disabled");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace gembridge::config
