#include "gembridge/gemini/validator.hpp"

#include "gembridge/common/fs.hpp"

#include <string>
#include <vector>

namespace gembridge::gemini {

GeminiResult finalize(GeminiResult result) {
  std::vector<std::string> errors;

  if (result.session_id.empty()) {
    errors.emplace_back("Failed to get `SESSION_ID` from the gemini session.");
  }

  if (result.agent_messages.empty()) {
    if (!result.return_all_messages) {
      errors.emplace_back("Failed to get `agent_messages` from the gemini session.\n"
                          "You can try to set `return_all_messages` to `True` to get the full "
                          "information.");
    } else if (result.all_messages.empty()) {
      errors.emplace_back("Failed to get any messages from the gemini session.");
    }
  }

  if (errors.empty()) {
    return result;
  }

  result.mark_failed();
  const std::string validation = common::join(errors, "\n");
  if (result.error.has_value() && !result.error->empty()) {
    result.error = *result.error + "\n" + validation;
  } else {
    result.error = validation;
  }
  return result;
}

} // namespace gembridge::gemini
