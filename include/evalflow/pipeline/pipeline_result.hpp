#pragma once

#include "evalflow/pipeline/agent_invoker.hpp"
#include "evalflow/util/id.hpp"
#include "evalflow/util/json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace evalflow {

struct StepResult {
  StepId step_id;
  bool success{false};
  std::string output_key;
  JsonValue output_value{};
  std::optional<std::string> error;
  double execution_time{0.0};
  TokenUsage token_usage;
};

struct PipelineResult {
  SampleId sample_id;
  bool success{false};
  // In execution order; stops at the first failed step.
  std::vector<StepResult> step_results;
  JsonValue final_outputs{};
  double total_execution_time{0.0};
  TokenUsage total_token_usage;
  std::optional<std::string> error;
};

[[nodiscard]] auto to_json(const TokenUsage &usage) -> JsonValue;
[[nodiscard]] auto to_json(const StepResult &result) -> JsonValue;
[[nodiscard]] auto to_json(const PipelineResult &result) -> JsonValue;

} // namespace evalflow
