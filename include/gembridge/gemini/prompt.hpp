#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace gembridge::gemini {

constexpr const char *DEFAULT_PROMPT_FILE = "GEMINI.md";
constexpr std::size_t MAX_PROMPT_PREFIX_BYTES = 100'000;

/// Contents of the prompt prefix file, unmodified. nullopt when the file is
/// missing, unreadable, larger than MAX_PROMPT_PREFIX_BYTES or blank; the
/// unreadable and oversized cases are reported as warnings.
[[nodiscard]] std::optional<std::string> read_prompt_prefix(const std::filesystem::path &path);

/// Joins the prefix (if any) and the caller's prompt with a blank line.
[[nodiscard]] std::string prepare_prompt(const std::filesystem::path &prefix_path,
                                         const std::string &user_prompt);

} // namespace gembridge::gemini
