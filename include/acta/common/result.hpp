#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace acta::common {

enum class ErrorCode {
  None,
  Validation,
  NotFound,
  Io,
  SessionNotFound,
  SessionEnded,
  SessionBusy,
  ProcessSpawn,
  Parse,
  Internal,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::Validation:
    return "ValidationError";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Io:
    return "IoError";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::SessionEnded:
    return "SessionEnded";
  case ErrorCode::SessionBusy:
    return "SessionBusy";
  case ErrorCode::ProcessSpawn:
    return "ProcessSpawnError";
  case ErrorCode::Parse:
    return "ParseError";
  case ErrorCode::Internal:
    return "InternalError";
  }
  return "InternalError";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Status(code == ErrorCode::None ? ErrorCode::Internal : code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorCode code, std::string error) : code_(code), error_(std::move(error)) {}

  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(ErrorCode::None, std::move(value), "");
  }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result(code == ErrorCode::None ? ErrorCode::Internal : code, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) { return failure(status.error(), status.code()); }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_, code_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace acta::common
