#pragma once

#include "evalflow/util/enum.hpp"
#include "evalflow/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace evalflow {

enum class FailureKind : std::uint8_t {
  None,
  UserCode,
  Timeout,
  OutputParse,
  InterpreterNotFound,
  FileNotFound,
  PermissionDenied,
  SpawnFailed,
};
BOOST_DESCRIBE_ENUM(FailureKind, None, UserCode, Timeout, OutputParse,
                    InterpreterNotFound, FileNotFound, PermissionDenied,
                    SpawnFailed)
EVALFLOW_DEFINE_ENUM_SERDE(FailureKind, FailureKind::None)

/// Outcome of one sandbox call. A timed-out run never carries output.
struct ExecutionResult {
  bool success{false};
  JsonValue output{};
  std::optional<std::string> error;
  std::optional<std::string> stderr_output;
  std::optional<std::string> stdout_output;
  std::optional<std::string> stack_trace;
  std::optional<int> exit_code;
  double execution_time{0.0};
  bool timed_out{false};
  FailureKind failure{FailureKind::None};

  [[nodiscard]] static auto failed(FailureKind kind, std::string message)
      -> ExecutionResult {
    ExecutionResult result;
    result.failure = kind;
    result.error = std::move(message);
    return result;
  }

  /// Short multi-line diagnostic combining error, stack trace and stderr.
  [[nodiscard]] auto describe() const -> std::string;
};

[[nodiscard]] auto to_json(const ExecutionResult &result) -> JsonValue;

} // namespace evalflow
