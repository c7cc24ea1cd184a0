#include "evalflow/sandbox/execution_result.hpp"

#include <cstdint>
#include <format>

namespace evalflow {

namespace {

[[nodiscard]] auto optional_text(const std::optional<std::string> &text)
    -> JsonValue {
  return text ? JsonValue(*text) : JsonValue{};
}

} // namespace

auto ExecutionResult::describe() const -> std::string {
  if (success) {
    return std::format("ok ({:.3f}s)", execution_time);
  }
  std::string out = error.value_or("unknown error");
  if (stack_trace && !stack_trace->empty()) {
    out += "\n";
    out += *stack_trace;
  } else if (stderr_output && !stderr_output->empty()) {
    out += "\n";
    out += *stderr_output;
  }
  return out;
}

auto to_json(const ExecutionResult &result) -> JsonValue {
  JsonValue j = JsonValue::object_t{};
  auto &obj = j.get_object();
  obj.emplace("success", result.success);
  obj.emplace("output", result.output);
  obj.emplace("error", optional_text(result.error));
  obj.emplace("stderr", optional_text(result.stderr_output));
  obj.emplace("stack_trace", optional_text(result.stack_trace));
  obj.emplace("exit_code", result.exit_code ? JsonValue(static_cast<std::int64_t>(*result.exit_code))
                                            : JsonValue{});
  obj.emplace("execution_time", result.execution_time);
  obj.emplace("timed_out", result.timed_out);
  obj.emplace("failure", std::string(to_string_view(result.failure)));
  return j;
}

} // namespace evalflow
