#include "gembridge/mcp/server.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/common/json_util.hpp"
#include "gembridge/gemini/deadline.hpp"
#include "gembridge/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>
#include <system_error>

namespace gembridge::mcp {

namespace {

constexpr const char *TOOL_DESCRIPTION =
    "Invokes the Gemini CLI to execute AI-driven tasks, returning structured JSON events and a "
    "session identifier for conversation continuity.";

constexpr const char *SERVER_INSTRUCTIONS =
    "This server provides a gemini tool for AI-driven tasks. Use the gemini tool to execute "
    "tasks via the Gemini CLI.";

constexpr const char *PROMPT_REQUIRED =
    "PROMPT is required and must be a non-empty, non-whitespace string";

std::string tool_input_schema() {
  std::ostringstream out;
  out << "{\"type\":\"object\",\"properties\":{"
      << "\"PROMPT\":{\"type\":\"string\",\"description\":"
      << common::json_quote("Instruction for the task to send to gemini.") << "},"
      << "\"sandbox\":{\"type\":\"boolean\",\"default\":false,\"description\":"
      << common::json_quote("Run in sandbox mode. Defaults to `False`.") << "},"
      << "\"SESSION_ID\":{\"type\":\"string\",\"description\":"
      << common::json_quote("Resume the specified session of the gemini. Defaults to empty "
                            "string, start a new session.")
      << "},"
      << "\"return_all_messages\":{\"type\":\"boolean\",\"default\":false,\"description\":"
      << common::json_quote("Return all messages (e.g. reasoning, tool calls, etc.) from the "
                            "gemini session. Set to `False` by default, only the agent's final "
                            "reply message is returned.")
      << "},"
      << "\"model\":{\"type\":\"string\",\"description\":"
      << common::json_quote("The model to use for the gemini session. If not specified, uses "
                            "GEMINI_FORCE_MODEL or the Gemini CLI default.")
      << "},"
      << "\"timeout_secs\":{\"type\":\"integer\",\"minimum\":" << gemini::MIN_TIMEOUT_SECS
      << ",\"maximum\":" << gemini::MAX_TIMEOUT_SECS << ",\"description\":"
      << common::json_quote("Timeout in seconds for the gemini execution. Defaults to "
                            "GEMINI_DEFAULT_TIMEOUT or 600.")
      << "}"
      << "},\"required\":[\"PROMPT\"]}";
  return out.str();
}

std::string timeout_range_message() {
  return "timeout_secs must be between " + std::to_string(gemini::MIN_TIMEOUT_SECS) + " and " +
         std::to_string(gemini::MAX_TIMEOUT_SECS) + " seconds";
}

common::Result<gemini::Options> invalid_params(const std::string &message) {
  return common::Result<gemini::Options>::failure(message, common::ErrorCode::InvalidRequest);
}

std::optional<std::string> take_bool(const common::JsonObject &args, const char *key,
                                     bool &out) {
  const auto it = args.find(key);
  if (it == args.end() || it->second.kind == common::JsonKind::Null) {
    return std::nullopt;
  }
  const auto value = common::json_bool_field(args, key);
  if (!value.has_value()) {
    return std::string(key) + " must be a boolean";
  }
  out = *value;
  return std::nullopt;
}

std::string text_content(const std::string &text) {
  return "{\"content\":[{\"type\":\"text\",\"text\":" + common::json_quote(text) +
         "}],\"isError\":false}";
}

} // namespace

common::Result<gemini::Options> parse_tool_arguments(const std::string &arguments) {
  const auto args = common::json_parse_object(arguments);
  if (!args.has_value()) {
    return invalid_params("arguments must be an object");
  }

  gemini::Options options;
  const auto prompt = args->find("PROMPT");
  if (prompt == args->end() || prompt->second.kind != common::JsonKind::String ||
      common::trim(prompt->second.text).empty()) {
    return invalid_params(PROMPT_REQUIRED);
  }
  options.prompt = prompt->second.text;

  if (auto error = take_bool(*args, "sandbox", options.sandbox); error.has_value()) {
    return invalid_params(*error);
  }
  if (auto error = take_bool(*args, "return_all_messages", options.return_all_messages);
      error.has_value()) {
    return invalid_params(*error);
  }

  if (const auto session = args->find("SESSION_ID");
      session != args->end() && session->second.kind != common::JsonKind::Null) {
    if (session->second.kind != common::JsonKind::String) {
      return invalid_params("SESSION_ID must be a string");
    }
    if (!session->second.text.empty()) {
      options.session_id = session->second.text;
    }
  }

  if (const auto model = args->find("model");
      model != args->end() && model->second.kind != common::JsonKind::Null) {
    if (model->second.kind != common::JsonKind::String ||
        common::trim(model->second.text).empty()) {
      return invalid_params(
          "Model overrides must be explicitly requested as a non-empty, non-whitespace string");
    }
    options.model = model->second.text;
  }

  if (const auto timeout = args->find("timeout_secs");
      timeout != args->end() && timeout->second.kind != common::JsonKind::Null) {
    if (timeout->second.kind != common::JsonKind::Number) {
      return invalid_params("timeout_secs must be an integer");
    }
    const std::string &raw = timeout->second.text;
    std::int64_t secs = 0;
    const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), secs);
    if (ec == std::errc::result_out_of_range) {
      return invalid_params(timeout_range_message());
    }
    if (ec != std::errc() || end != raw.data() + raw.size()) {
      return invalid_params("timeout_secs must be an integer");
    }
    if (!gemini::timeout_in_range(secs)) {
      return invalid_params(timeout_range_message());
    }
    options.timeout_secs = secs;
  }

  return common::Result<gemini::Options>::success(std::move(options));
}

ToolOutcome render_tool_outcome(const gemini::GeminiResult &result,
                                const bool requested_all_messages) {
  ToolOutcome outcome;
  outcome.success = result.success;
  const bool include_events = requested_all_messages && !result.all_messages.empty();

  if (result.success) {
    outcome.text = "success: true\nSESSION_ID: " + result.session_id +
                   "\nagent_messages: " + result.agent_messages;
    if (include_events) {
      outcome.text += "\nall_messages: " + std::to_string(result.all_messages.size()) +
                      " events captured\n\nFull event log:\n" +
                      common::json_pretty_array(result.all_messages);
    }
    return outcome;
  }

  outcome.text = result.error.value_or("Unknown error");
  if (include_events) {
    outcome.text += "\n\nCaptured " + std::to_string(result.all_messages.size()) +
                    " events before failure:\n" + common::json_pretty_array(result.all_messages);
  }
  return outcome;
}

McpServer::McpServer(GeminiRunner runner, std::string version)
    : runner_(std::move(runner)), version_(std::move(version)) {
  if (version_.empty()) {
    version_ = "0.1.0";
  }
}

McpServer::~McpServer() { join_workers(); }

void McpServer::serve(std::istream &in, std::ostream &out) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (common::trim(line).empty()) {
      continue;
    }

    // Only tool calls are slow; keep the read loop responsive for the rest.
    if (common::json_validate(line)) {
      auto request = parse_rpc_request(line);
      if (request.ok() && request.value().method == "tools/call" &&
          !request.value().is_notification()) {
        reap_finished_workers();
        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
          std::thread thread([this, &out, done, req = request.value()]() {
            write_line(out, handle_request(req));
            done->store(true);
          });
          workers_.push_back(Worker{std::move(thread), std::move(done)});
        } catch (const std::system_error &err) {
          observability::record_warning(
              "mcp", std::string("no worker thread for tool call, running inline: ") +
                         err.what());
          write_line(out, handle_request(request.value()));
        }
        continue;
      }
    }

    if (auto response = handle_line(line); response.has_value()) {
      write_line(out, *response);
    }
  }
  join_workers();
}

std::optional<std::string> McpServer::handle_line(const std::string &line) const {
  if (common::trim(line).empty()) {
    return std::nullopt;
  }
  if (!common::json_validate(line)) {
    observability::record_warning("mcp", "discarding malformed request line");
    return rpc_error("null", RPC_PARSE_ERROR, "Parse error");
  }
  auto request = parse_rpc_request(line);
  if (!request.ok()) {
    return rpc_error("null", RPC_INVALID_REQUEST, "Invalid Request: " + request.error());
  }
  if (request.value().is_notification()) {
    return std::nullopt;
  }
  return handle_request(request.value());
}

std::string McpServer::handle_request(const RpcRequest &request) const {
  const std::string &id = *request.id;
  if (request.method == "initialize") {
    return handle_initialize(request);
  }
  if (request.method == "ping") {
    return rpc_result(id, "{}");
  }
  if (request.method == "tools/list") {
    return handle_tools_list(request);
  }
  if (request.method == "tools/call") {
    return handle_tools_call(request);
  }
  return rpc_error(id, RPC_METHOD_NOT_FOUND, "Method not found: " + request.method);
}

std::string McpServer::handle_initialize(const RpcRequest &request) const {
  std::ostringstream result;
  result << "{\"protocolVersion\":" << common::json_quote(PROTOCOL_VERSION)
         << ",\"capabilities\":{\"tools\":{}}"
         << ",\"serverInfo\":{\"name\":" << common::json_quote(SERVER_NAME)
         << ",\"version\":" << common::json_quote(version_) << "}"
         << ",\"instructions\":" << common::json_quote(SERVER_INSTRUCTIONS) << "}";
  return rpc_result(*request.id, result.str());
}

std::string McpServer::handle_tools_list(const RpcRequest &request) const {
  std::ostringstream result;
  result << "{\"tools\":[{\"name\":" << common::json_quote(TOOL_NAME)
         << ",\"description\":" << common::json_quote(TOOL_DESCRIPTION)
         << ",\"inputSchema\":" << tool_input_schema() << "}]}";
  return rpc_result(*request.id, result.str());
}

std::string McpServer::handle_tools_call(const RpcRequest &request) const {
  const std::string &id = *request.id;
  const auto params = common::json_parse_object(request.params);
  if (!params.has_value()) {
    return rpc_error(id, RPC_INVALID_PARAMS, "params must be an object");
  }
  const auto name = common::json_string_field(*params, "name");
  if (!name.has_value() || *name != TOOL_NAME) {
    return rpc_error(id, RPC_INVALID_PARAMS, "Unknown tool: " + name.value_or(""));
  }

  std::string arguments = "{}";
  if (const auto args = params->find("arguments"); args != params->end()) {
    if (args->second.kind == common::JsonKind::Object) {
      arguments = args->second.text;
    } else if (args->second.kind != common::JsonKind::Null) {
      return rpc_error(id, RPC_INVALID_PARAMS, "arguments must be an object");
    }
  }

  auto options = parse_tool_arguments(arguments);
  if (!options.ok()) {
    return rpc_error(id, RPC_INVALID_PARAMS, options.error());
  }

  auto result = runner_(options.value());
  if (!result.ok()) {
    if (result.code() == common::ErrorCode::InvalidRequest) {
      return rpc_error(id, RPC_INVALID_PARAMS, result.error());
    }
    return rpc_error(id, RPC_INTERNAL_ERROR, "Failed to execute gemini: " + result.error());
  }

  const auto outcome = render_tool_outcome(result.value(), options.value().return_all_messages);
  if (!outcome.success) {
    return rpc_error(id, RPC_INTERNAL_ERROR, outcome.text);
  }
  return rpc_result(id, text_content(outcome.text));
}

void McpServer::write_line(std::ostream &out, const std::string &line) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out << line << "\n";
  out.flush();
}

void McpServer::reap_finished_workers() {
  auto finished = std::remove_if(workers_.begin(), workers_.end(), [](Worker &worker) {
    if (!worker.done->load()) {
      return false;
    }
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
    return true;
  });
  workers_.erase(finished, workers_.end());
}

void McpServer::join_workers() {
  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

} // namespace gembridge::mcp
