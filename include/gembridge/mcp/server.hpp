#pragma once

#include "gembridge/common/result.hpp"
#include "gembridge/gemini/types.hpp"
#include "gembridge/mcp/protocol.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gembridge::mcp {

constexpr const char *SERVER_NAME = "gembridge";
constexpr const char *TOOL_NAME = "gemini";

using GeminiRunner =
    std::function<common::Result<gemini::GeminiResult>(const gemini::Options &)>;

/// Text block returned to the MCP client for one finished invocation.
struct ToolOutcome {
  bool success = false;
  std::string text;
};

/// Decodes the `arguments` object of a tools/call into invocation options.
/// Failures carry ErrorCode::InvalidRequest and map to RPC_INVALID_PARAMS.
[[nodiscard]] common::Result<gemini::Options> parse_tool_arguments(const std::string &arguments);

[[nodiscard]] ToolOutcome render_tool_outcome(const gemini::GeminiResult &result,
                                              bool requested_all_messages);

/// MCP server over line-delimited JSON-RPC. Tool calls may take minutes, so
/// serve() runs each one on its own thread and keeps reading; responses are
/// written whole, one per line, under a lock. Finished workers are joined as
/// new requests arrive.
class McpServer {
public:
  explicit McpServer(GeminiRunner runner, std::string version = "");
  ~McpServer();

  McpServer(const McpServer &) = delete;
  McpServer &operator=(const McpServer &) = delete;

  /// Reads requests until EOF, then waits for in-flight tool calls.
  void serve(std::istream &in, std::ostream &out);

  /// Handles one line synchronously. nullopt when no response is due
  /// (notifications and blank lines).
  [[nodiscard]] std::optional<std::string> handle_line(const std::string &line) const;

  /// Worker threads not yet joined. Only meaningful on the thread running serve().
  [[nodiscard]] std::size_t live_workers() const { return workers_.size(); }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  [[nodiscard]] std::string handle_request(const RpcRequest &request) const;
  [[nodiscard]] std::string handle_initialize(const RpcRequest &request) const;
  [[nodiscard]] std::string handle_tools_list(const RpcRequest &request) const;
  [[nodiscard]] std::string handle_tools_call(const RpcRequest &request) const;

  void write_line(std::ostream &out, const std::string &line);
  void reap_finished_workers();
  void join_workers();

  GeminiRunner runner_;
  std::string version_;
  std::mutex out_mutex_;
  std::vector<Worker> workers_;
};

} // namespace gembridge::mcp
