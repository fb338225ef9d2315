#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace gembridge::common {

/// Failure categories that callers need to tell apart.
enum class ErrorCode {
  None,
  InvalidRequest,
  Spawn,
  Stream,
  Timeout,
  Io,
};

[[nodiscard]] const char *error_code_name(ErrorCode code);

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::None); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Io) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), "", ErrorCode::None);
  }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Io) {
    return Result(false, std::nullopt, std::move(message), code);
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.error(), status.code());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

inline const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidRequest:
    return "invalid_request";
  case ErrorCode::Spawn:
    return "spawn";
  case ErrorCode::Stream:
    return "stream";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Io:
    return "io";
  }
  return "unknown";
}

} // namespace gembridge::common
