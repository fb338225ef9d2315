#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "gembridge/config/config.hpp"
#include "gembridge/gemini/deadline.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = gembridge::config::config_path_override();
    if (next.has_value()) {
      gembridge::config::set_config_path_override(*next);
    } else {
      gembridge::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      gembridge::config::set_config_path_override(*old_override);
    } else {
      gembridge::config::clear_config_path_override();
    }
  }
};

} // namespace

void register_config_tests(std::vector<gembridge::tests::TestCase> &tests) {
  using gembridge::tests::require;
  using gembridge::testing::EnvGuard;
  using gembridge::testing::fixed_env;
  using gembridge::testing::TempWorkspace;
  namespace cfg = gembridge::config;

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("GEMBRIDGE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config(fixed_env({}));
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().gemini.binary == "gemini", "default binary");
                     require(loaded.value().gemini.default_timeout_secs == 600,
                             "default timeout");
                     require(!loaded.value().gemini.force_model.has_value(), "no forced model");
                     require(loaded.value().gemini.prompt_file == "GEMINI.md",
                             "default prompt file");
                     require(loaded.value().observability.backend == "log", "default backend");
                   }});

  tests.push_back({"config_path_defaults_under_home", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("GEMBRIDGE_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home.path() / ".gembridge" / "config.toml",
                             "unexpected config path: " + path.value().string());
                     require(!cfg::config_exists(), "config should not exist yet");
                   }});

  tests.push_back({"load_config_reads_toml_override_path", [] {
                     const TempWorkspace workspace;
                     const auto file = workspace.create_file("custom.toml", R"(
[gemini]
binary = "/usr/local/bin/gemini"
default_timeout_secs = 90
force_model = "gemini-2.5-flash"
prompt_file = "PROMPT.md"

[observability]
backend = "NONE"
)");
                     const ConfigOverrideGuard cfg_override(file);
                     require(cfg::config_exists(), "override file should exist");

                     const auto loaded = cfg::load_config(fixed_env({}));
                     require(loaded.ok(), loaded.error());
                     const auto &gemini = loaded.value().gemini;
                     require(gemini.binary == "/usr/local/bin/gemini", "binary mismatch");
                     require(gemini.default_timeout_secs == 90, "timeout mismatch");
                     require(gemini.force_model == std::optional<std::string>("gemini-2.5-flash"),
                             "model mismatch");
                     require(gemini.prompt_file == "PROMPT.md", "prompt file mismatch");
                     require(loaded.value().observability.backend == "none",
                             "backend should be lowercased");
                   }});

  tests.push_back({"out_of_range_config_timeout_falls_back_to_default", [] {
                     for (const char *value : {"0", "3601", "99999999999999999999"}) {
                       const auto parsed = cfg::parse_config(
                           std::string("[gemini]\ndefault_timeout_secs = ") + value + "\n");
                       require(parsed.ok(), parsed.error());
                       require(parsed.value().gemini.default_timeout_secs == 600,
                               std::string("timeout should fall back for ") + value);
                     }
                   }});

  tests.push_back({"invalid_toml_is_an_error", [] {
                     const TempWorkspace workspace;
                     const auto file = workspace.create_file("broken.toml", "[gemini]\nnonsense\n");
                     const ConfigOverrideGuard cfg_override(file);
                     const auto loaded = cfg::load_config(fixed_env({}));
                     require(!loaded.ok(), "broken config should fail");
                     require(loaded.error().find("broken.toml") != std::string::npos,
                             "error should name the file");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     const auto parsed = cfg::parse_config(
                         "[gemini]\nbinary = \"from-file\"\ndefault_timeout_secs = 30\n");
                     require(parsed.ok(), parsed.error());
                     auto config = parsed.value();
                     cfg::apply_env_overrides(config, fixed_env({{"GEMINI_BIN", "/bin/gem"},
                                                                 {"GEMINI_DEFAULT_TIMEOUT", "45"},
                                                                 {"GEMINI_FORCE_MODEL", " pro "},
                                                                 {"GEMBRIDGE_LOG", "None"}}));
                     require(config.gemini.binary == "/bin/gem", "binary override");
                     require(config.gemini.default_timeout_secs == 45, "timeout override");
                     require(config.gemini.force_model == std::optional<std::string>("pro"),
                             "model override trimmed");
                     require(config.observability.backend == "none", "log override");
                   }});

  tests.push_back({"env_timeout_out_of_range_uses_default", [] {
                     for (const char *value : {"0", "3601", "abc", "-5", ""}) {
                       cfg::Config config;
                       config.gemini.default_timeout_secs = 30;
                       cfg::apply_env_overrides(config,
                                                fixed_env({{"GEMINI_DEFAULT_TIMEOUT", value}}));
                       require(config.gemini.default_timeout_secs == 600,
                               std::string("expected fallback for '") + value + "'");
                     }
                   }});

  tests.push_back({"blank_env_values_are_ignored", [] {
                     cfg::Config config;
                     cfg::apply_env_overrides(
                         config, fixed_env({{"GEMINI_BIN", "  "}, {"GEMINI_FORCE_MODEL", ""}}));
                     require(config.gemini.binary == "gemini", "blank binary ignored");
                     require(!config.gemini.force_model.has_value(), "blank model ignored");
                   }});

  tests.push_back({"validate_config_reports_errors_and_warnings", [] {
                     cfg::Config config;
                     const auto ok = cfg::validate_config(config);
                     require(ok.ok(), ok.error());
                     require(ok.value().empty(), "defaults should not warn");

                     config.observability.backend = "statsd";
                     const auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 1, "unknown backend should warn");

                     config.gemini.binary = " ";
                     require(!cfg::validate_config(config).ok(), "blank binary is an error");

                     cfg::Config timeouts;
                     timeouts.gemini.default_timeout_secs = 0;
                     require(!cfg::validate_config(timeouts).ok(), "zero timeout is an error");
                   }});
}
