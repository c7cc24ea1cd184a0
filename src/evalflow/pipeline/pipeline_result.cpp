#include "evalflow/pipeline/pipeline_result.hpp"

namespace evalflow {

namespace {

[[nodiscard]] auto optional_text(const std::optional<std::string> &text)
    -> JsonValue {
  return text ? JsonValue(*text) : JsonValue{};
}

} // namespace

auto to_json(const TokenUsage &usage) -> JsonValue {
  return JsonValue{{"input_tokens", usage.input_tokens},
                   {"output_tokens", usage.output_tokens},
                   {"total_tokens", usage.total_tokens}};
}

auto to_json(const StepResult &result) -> JsonValue {
  JsonValue j{{"step_id", result.step_id.str()},
              {"success", result.success},
              {"output_key", result.output_key},
              {"output_value", result.output_value},
              {"execution_time", result.execution_time}};
  auto &obj = j.get_object();
  obj.emplace("error", optional_text(result.error));
  obj.emplace("token_usage", to_json(result.token_usage));
  return j;
}

auto to_json(const PipelineResult &result) -> JsonValue {
  JsonValue steps = std::vector<JsonValue>{};
  for (const auto &step : result.step_results) {
    steps.get_array().emplace_back(to_json(step));
  }
  JsonValue j{{"sample_id", result.sample_id.str()},
              {"success", result.success},
              {"final_outputs", result.final_outputs},
              {"total_execution_time", result.total_execution_time}};
  auto &obj = j.get_object();
  obj.emplace("step_results", std::move(steps));
  obj.emplace("total_token_usage", to_json(result.total_token_usage));
  obj.emplace("error", optional_text(result.error));
  return j;
}

} // namespace evalflow
