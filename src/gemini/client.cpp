#include "gembridge/gemini/client.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/gemini/deadline.hpp"
#include "gembridge/gemini/prompt.hpp"
#include "gembridge/gemini/request.hpp"
#include "gembridge/observability/global.hpp"

namespace gembridge::gemini {

ClientConfig client_config_from(const config::Config &config) {
  ClientConfig client;
  client.binary = config.gemini.binary;
  client.default_timeout = std::chrono::seconds(
      timeout_in_range(config.gemini.default_timeout_secs) ? config.gemini.default_timeout_secs
                                                           : DEFAULT_TIMEOUT_SECS);
  client.force_model = config.gemini.force_model;
  client.prompt_prefix_path = common::trim(config.gemini.prompt_file);
  return client;
}

GeminiClient::GeminiClient(ClientConfig config) : config_(std::move(config)) {}

common::Result<GeminiResult> GeminiClient::run(const Options &options) const {
  if (const auto status = validate_options(options); !status.ok()) {
    return common::Result<GeminiResult>::failure(status);
  }

  Options effective = options;
  if (!effective.model.has_value() && config_.force_model.has_value()) {
    effective.model = config_.force_model;
  }
  if (effective.session_id.has_value() && effective.session_id->empty()) {
    effective.session_id.reset();
  }

  const auto timeout = resolve_timeout(effective.timeout_secs, config_.default_timeout);
  const std::string prompt = prepare_prompt(config_.prompt_prefix_path, effective.prompt);
  const auto argv = build_argv(config_.binary, effective, prompt);

  observability::record_invocation_start(config_.binary, effective.model.value_or(""), timeout,
                                         effective.sandbox, effective.session_id.has_value());

  const Deadline deadline = Deadline::after(timeout);
  auto outcome = supervisor_.run(argv, effective.return_all_messages, deadline);

  if (!outcome.ok()) {
    if (outcome.code() != common::ErrorCode::Timeout) {
      observability::record_error(
          "gemini", std::string(common::error_code_name(outcome.code())) + ": " + outcome.error());
    }
    observability::record_invocation_end(deadline.elapsed(), false, "");
    return outcome;
  }

  const GeminiResult &result = outcome.value();
  observability::record_invocation_end(deadline.elapsed(), result.success, result.session_id);
  return outcome;
}

} // namespace gembridge::gemini
