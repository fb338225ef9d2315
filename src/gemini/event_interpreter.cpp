#include "gembridge/gemini/event_interpreter.hpp"

#include "gembridge/common/fs.hpp"

namespace gembridge::gemini {

namespace {

constexpr const char *KEY_SESSION_ID = "session_id";
constexpr const char *KEY_TYPE = "type";
constexpr const char *KEY_ROLE = "role";
constexpr const char *KEY_CONTENT = "content";
constexpr const char *KEY_ERROR = "error";
constexpr const char *KEY_MESSAGE = "message";
constexpr const char *TYPE_MESSAGE = "message";
constexpr const char *ROLE_ASSISTANT = "assistant";
constexpr const char *ERROR_PREFIX = "gemini error: ";

std::string string_or_empty(const common::JsonObject &fields, const char *key) {
  return common::json_string_field(fields, key).value_or("");
}

bool is_deprecation_notice(const common::JsonObject &fields) {
  return string_or_empty(fields, KEY_TYPE) == TYPE_MESSAGE &&
         string_or_empty(fields, KEY_ROLE) == ROLE_ASSISTANT &&
         string_or_empty(fields, KEY_CONTENT) == PROMPT_DEPRECATION_WARNING;
}

void collect_assistant_text(const common::JsonObject &fields, GeminiResult &state) {
  if (string_or_empty(fields, KEY_TYPE) != TYPE_MESSAGE ||
      string_or_empty(fields, KEY_ROLE) != ROLE_ASSISTANT) {
    return;
  }
  const std::string content = string_or_empty(fields, KEY_CONTENT);
  if (content.empty()) {
    return;
  }
  if (!state.agent_messages.empty()) {
    state.agent_messages.push_back('\n');
  }
  state.agent_messages += content;
}

void detect_error(const common::JsonObject &fields, GeminiResult &state) {
  const std::string type = common::to_lower(string_or_empty(fields, KEY_TYPE));
  const bool typed_error =
      type.find("fail") != std::string::npos || type.find("error") != std::string::npos;
  const auto error_it = fields.find(KEY_ERROR);
  const bool has_error_member = error_it != fields.end();
  if (!typed_error && !has_error_member) {
    return;
  }

  state.mark_failed();
  if (has_error_member && error_it->second.kind == common::JsonKind::Object) {
    const auto error_object = common::json_parse_object(error_it->second.text);
    if (error_object.has_value()) {
      if (const auto message = common::json_string_field(*error_object, KEY_MESSAGE);
          message.has_value()) {
        state.error = ERROR_PREFIX + *message;
      }
    }
    return;
  }
  if (const auto message = common::json_string_field(fields, KEY_MESSAGE); message.has_value()) {
    state.error = ERROR_PREFIX + *message;
  }
}

} // namespace

std::optional<Event> decode_event(const std::string &line) {
  Event event;
  event.raw = line;
  if (auto object = common::json_parse_object(line); object.has_value()) {
    event.kind = common::JsonKind::Object;
    event.fields = std::move(*object);
    return event;
  }
  const auto kind = common::json_value_kind(line);
  if (!kind.has_value()) {
    return std::nullopt;
  }
  event.kind = *kind;
  return event;
}

void apply_event(const Event &event, GeminiResult &state, const bool capture_all) {
  if (capture_all && state.all_messages.size() < MAX_CAPTURED_EVENTS) {
    state.all_messages.push_back(event.raw);
  }

  if (event.kind != common::JsonKind::Object) {
    return;
  }

  if (const auto session_id = common::json_string_field(event.fields, KEY_SESSION_ID);
      session_id.has_value() && !session_id->empty()) {
    state.session_id = *session_id;
  }

  // The CLI's own deprecation notice is noise: nothing past the session id
  // is taken from it.
  if (is_deprecation_notice(event.fields)) {
    return;
  }
  collect_assistant_text(event.fields, state);
  detect_error(event.fields, state);
}

} // namespace gembridge::gemini
