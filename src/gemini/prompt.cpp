#include "gembridge/gemini/prompt.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/observability/global.hpp"

#include <fstream>
#include <sstream>

namespace gembridge::gemini {

std::optional<std::string> read_prompt_prefix(const std::filesystem::path &path) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      observability::record_warning("prompt", "Cannot access " + path.string() + ": " +
                                                  ec.message());
    }
    return std::nullopt;
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    observability::record_warning("prompt", "Cannot access " + path.string() + ": " +
                                                ec.message());
    return std::nullopt;
  }
  if (size > MAX_PROMPT_PREFIX_BYTES) {
    observability::record_warning(
        "prompt", path.string() + " is too large (" + std::to_string(size) + " bytes, max " +
                      std::to_string(MAX_PROMPT_PREFIX_BYTES) + " bytes), ignoring it");
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    observability::record_warning("prompt", "Failed to read " + path.string());
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (common::trim(content).empty()) {
    return std::nullopt;
  }
  return content;
}

std::string prepare_prompt(const std::filesystem::path &prefix_path,
                           const std::string &user_prompt) {
  if (prefix_path.empty()) {
    return user_prompt;
  }
  const auto prefix = read_prompt_prefix(prefix_path);
  if (!prefix.has_value()) {
    return user_prompt;
  }
  return *prefix + "\n\n" + user_prompt;
}

} // namespace gembridge::gemini
