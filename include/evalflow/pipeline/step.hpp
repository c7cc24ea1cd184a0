#pragma once

#include "evalflow/batch/aggregator.hpp"
#include "evalflow/core/constants.hpp"
#include "evalflow/sandbox/code_spec.hpp"
#include "evalflow/util/enum.hpp"
#include "evalflow/util/id.hpp"
#include "evalflow/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evalflow {

enum class StepType : std::uint8_t {
  AgentFlow,
  CodeNode,
  BatchAggregator,
};
BOOST_DESCRIBE_ENUM(StepType, AgentFlow, CodeNode, BatchAggregator)
EVALFLOW_DEFINE_ENUM_SERDE(StepType, StepType::AgentFlow)

struct AgentFlowStep {
  std::string agent;
  std::string flow;
  std::optional<std::string> model_override;
};

struct CodeNodeStep {
  CodeSpec code;
};

struct BatchAggregatorStep {
  AggregationStrategy strategy{AggregationStrategy::Concat};
  AggregationParams params;
  // Source text of params.condition, kept for display.
  std::string condition_text;
};

using StepKind = std::variant<AgentFlowStep, CodeNodeStep, BatchAggregatorStep>;

[[nodiscard]] inline auto step_type(const StepKind &kind) noexcept -> StepType {
  return static_cast<StepType>(kind.index());
}

/// Step parameter `param` takes the context value stored under `context_key`.
struct InputBinding {
  std::string param;
  std::string context_key;
};

struct BatchOptions {
  int batch_size{batch_defaults::kBatchSize};
  bool concurrent{batch_defaults::kConcurrent};
  std::size_t max_workers{batch_defaults::kMaxWorkers};
  std::string items_param{"items"};
};

struct StepConfig {
  StepId id;
  StepKind kind;
  std::vector<InputBinding> input_mapping;
  std::string output_key;
  // Set: fan the step out over the list bound to items_param.
  std::optional<BatchOptions> batch;
  std::string description;
};

struct PipelineDefinition {
  std::string id;
  std::string name;
  std::string description;
  std::vector<StepConfig> steps;
};

struct Sample {
  SampleId id;
  // Object whose members seed the context.
  JsonValue inputs{};
};

} // namespace evalflow
