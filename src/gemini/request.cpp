#include "gembridge/gemini/request.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/gemini/deadline.hpp"

namespace gembridge::gemini {

common::Status validate_options(const Options &options) {
  if (common::trim(options.prompt).empty()) {
    return common::Status::error("Prompt must be a non-empty, non-whitespace string",
                                 common::ErrorCode::InvalidRequest);
  }
  if (options.model.has_value() && common::trim(*options.model).empty()) {
    return common::Status::error(
        "Model overrides must be explicitly requested as a non-empty, non-whitespace string",
        common::ErrorCode::InvalidRequest);
  }
  if (options.timeout_secs.has_value() && !timeout_in_range(*options.timeout_secs)) {
    return common::Status::error("timeout_secs must be between " +
                                     std::to_string(MIN_TIMEOUT_SECS) + " and " +
                                     std::to_string(MAX_TIMEOUT_SECS) + " seconds",
                                 common::ErrorCode::InvalidRequest);
  }
  return common::Status::success();
}

std::vector<std::string> build_argv(const std::string &binary, const Options &options,
                                    const std::string &prompt) {
  std::vector<std::string> argv{binary, "--prompt", prompt, "-o", "stream-json"};
  if (options.sandbox) {
    argv.emplace_back("--sandbox");
  }
  if (options.model.has_value()) {
    argv.emplace_back("--model");
    argv.push_back(*options.model);
  }
  if (options.session_id.has_value()) {
    argv.emplace_back("--resume");
    argv.push_back(*options.session_id);
  }
  return argv;
}

} // namespace gembridge::gemini
