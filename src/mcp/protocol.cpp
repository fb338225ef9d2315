#include "gembridge/mcp/protocol.hpp"

#include "gembridge/common/json_util.hpp"

#include <sstream>

namespace gembridge::mcp {

common::Result<RpcRequest> parse_rpc_request(const std::string &line) {
  const auto object = common::json_parse_object(line);
  if (!object.has_value()) {
    return common::Result<RpcRequest>::failure("request must be a JSON object",
                                               common::ErrorCode::InvalidRequest);
  }

  RpcRequest request;
  if (const auto id = object->find("id"); id != object->end()) {
    switch (id->second.kind) {
    case common::JsonKind::String:
      request.id = common::json_quote(id->second.text);
      break;
    case common::JsonKind::Number:
      request.id = id->second.text;
      break;
    case common::JsonKind::Null:
      request.id = "null";
      break;
    default:
      return common::Result<RpcRequest>::failure("id must be a string or a number",
                                                 common::ErrorCode::InvalidRequest);
    }
  }

  const auto method = common::json_string_field(*object, "method");
  if (!method.has_value() || method->empty()) {
    return common::Result<RpcRequest>::failure("missing method",
                                               common::ErrorCode::InvalidRequest);
  }
  request.method = *method;

  if (const auto params = object->find("params"); params != object->end()) {
    if (params->second.kind == common::JsonKind::Object) {
      request.params = params->second.text;
    } else if (params->second.kind != common::JsonKind::Null) {
      return common::Result<RpcRequest>::failure("params must be an object",
                                                 common::ErrorCode::InvalidRequest);
    }
  }

  return common::Result<RpcRequest>::success(std::move(request));
}

std::string rpc_result(const std::string &id, const std::string &result_json) {
  std::ostringstream out;
  out << "{\"jsonrpc\":\"2.0\",\"id\":" << id << ",\"result\":" << result_json << "}";
  return out.str();
}

std::string rpc_error(const std::string &id, const int code, const std::string &message) {
  std::ostringstream out;
  out << "{\"jsonrpc\":\"2.0\",\"id\":" << id << ",\"error\":{\"code\":" << code
      << ",\"message\":" << common::json_quote(message) << "}}";
  return out.str();
}

} // namespace gembridge::mcp
