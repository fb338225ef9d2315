#pragma once

#include "gembridge/common/result.hpp"

#include <optional>
#include <string>

namespace gembridge::mcp {

constexpr const char *PROTOCOL_VERSION = "2024-11-05";

constexpr int RPC_PARSE_ERROR = -32700;
constexpr int RPC_INVALID_REQUEST = -32600;
constexpr int RPC_METHOD_NOT_FOUND = -32601;
constexpr int RPC_INVALID_PARAMS = -32602;
constexpr int RPC_INTERNAL_ERROR = -32603;

/// One JSON-RPC 2.0 message read from the client.
struct RpcRequest {
  /// Raw JSON text of the id, echoed back verbatim. nullopt for notifications.
  std::optional<std::string> id;
  std::string method;
  /// Raw JSON object text of params; "{}" when absent.
  std::string params = "{}";

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

/// Parses one line. The caller is expected to have rejected malformed JSON
/// already; failures here mean a well-formed value that is not a request.
[[nodiscard]] common::Result<RpcRequest> parse_rpc_request(const std::string &line);

[[nodiscard]] std::string rpc_result(const std::string &id, const std::string &result_json);
[[nodiscard]] std::string rpc_error(const std::string &id, int code, const std::string &message);

} // namespace gembridge::mcp
