#pragma once

#include "gembridge/common/result.hpp"
#include "gembridge/gemini/deadline.hpp"
#include "gembridge/gemini/types.hpp"

#include <string>
#include <vector>

namespace gembridge::gemini {

/// Runs one child process to completion and aggregates its event stream.
///
/// stdout and stderr are multiplexed with poll() in a single loop, so exactly
/// one line is handled at a time and neither pipe can fill up while the other
/// is being waited on. stdout lines are decoded as JSON events; stderr lines
/// go to a capped diagnostic buffer.
///
/// Failures that prevent an aggregated result are returned as errors:
/// ErrorCode::Spawn when the binary cannot be started, ErrorCode::Stream when
/// reading stdout or reaping the child fails, ErrorCode::Timeout when the
/// deadline expires. In every such case the child has been killed and reaped
/// before run() returns. Everything else, including a non-zero exit, ends up
/// in the returned GeminiResult after finalize().
class Supervisor {
public:
  [[nodiscard]] common::Result<GeminiResult> run(const std::vector<std::string> &argv,
                                                 bool capture_all,
                                                 const Deadline &deadline) const;
};

} // namespace gembridge::gemini
