#include "gembridge/cli/commands.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/config/config.hpp"
#include "gembridge/gemini/client.hpp"
#include "gembridge/mcp/server.hpp"
#include "gembridge/observability/factory.hpp"
#include "gembridge/observability/global.hpp"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace gembridge::cli {

namespace {

std::string version_number() {
#ifdef GEMBRIDGE_VERSION
  return GEMBRIDGE_VERSION;
#else
  return "0.1.0";
#endif
}

std::string version_string() { return "gembridge " + version_number(); }

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

/// Loads configuration and installs the process-wide observer. Config
/// warnings are reported through the observer once it exists.
common::Result<config::Config> bootstrap() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure(warnings.error());
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return loaded;
}

int run_serve(std::vector<std::string> args) {
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }
  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  const gemini::GeminiClient client(gemini::client_config_from(cfg.value()));
  mcp::McpServer server(
      [&client](const gemini::Options &options) { return client.run(options); },
      version_number());
  server.serve(std::cin, std::cout);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_once(std::vector<std::string> args) {
  std::string message;
  std::string model;
  std::string session;
  std::string timeout_raw;
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--model", "", model);
  (void)take_option(args, "--session", "-s", session);
  (void)take_option(args, "--timeout", "-t", timeout_raw);
  const bool sandbox = take_flag(args, "--sandbox");
  const bool all_messages = take_flag(args, "--all-messages");

  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      std::cerr << "unknown option: " << arg << "\n";
      return 1;
    }
  }
  if (message.empty()) {
    message = join_tokens(args);
  }

  gemini::Options options;
  options.prompt = message;
  options.sandbox = sandbox;
  options.return_all_messages = all_messages;
  if (!model.empty()) {
    options.model = model;
  }
  if (!session.empty()) {
    options.session_id = session;
  }
  if (!timeout_raw.empty()) {
    std::int64_t secs = 0;
    const auto [end, ec] =
        std::from_chars(timeout_raw.data(), timeout_raw.data() + timeout_raw.size(), secs);
    if (ec != std::errc() || end != timeout_raw.data() + timeout_raw.size()) {
      std::cerr << "invalid timeout: " << timeout_raw << "\n";
      return 1;
    }
    options.timeout_secs = secs;
  }

  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  const gemini::GeminiClient client(gemini::client_config_from(cfg.value()));
  auto result = client.run(options);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }

  const auto outcome = mcp::render_tool_outcome(result.value(), all_messages);
  if (!outcome.success) {
    std::cerr << outcome.text << "\n";
    return 1;
  }
  std::cout << outcome.text << "\n";
  return 0;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  gembridge" << RESET << DIM
            << " - MCP server wrapping the Gemini CLI" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "gembridge [--config PATH] [command] [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "          Run the MCP server on stdio (default)" << RESET << "\n";
  std::cout << "  " << GREEN << "run -m" << RESET << " PROMPT" << DIM
            << "  Run a single prompt and print the result" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";

  std::cout << BOLD << "  RUN OPTIONS" << RESET << "\n";
  std::cout << "  --sandbox            Run gemini in sandbox mode\n";
  std::cout << "  --model M            Model override\n";
  std::cout << "  --session ID         Resume an existing session\n";
  std::cout << "  --timeout N          Timeout in seconds (1-3600)\n";
  std::cout << "  --all-messages       Include the full event log\n\n";

  std::cout << BOLD << "  ENVIRONMENT" << RESET << "\n";
  std::cout << "  GEMINI_BIN               Gemini binary (default: gemini)\n";
  std::cout << "  GEMINI_DEFAULT_TIMEOUT   Default timeout in seconds (1-3600, default: 600)\n";
  std::cout << "  GEMINI_FORCE_MODEL       Model used when a request names none\n";
  std::cout << "  GEMBRIDGE_LOG            Log backend: log or none\n";
  std::cout << "  GEMBRIDGE_CONFIG_PATH    Config file (default: ~/.gembridge/config.toml)\n\n";

  std::cout << BOLD << "  GEMINI.md" << RESET << "\n";
  std::cout << "  If GEMINI.md exists in the working directory (max 100KB), its content is\n";
  std::cout << "  prepended to every prompt.\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    return run_serve({});
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "run") {
    return run_once(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace gembridge::cli
