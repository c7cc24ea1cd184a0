#pragma once

#include "evalflow/batch/aggregator.hpp"
#include "evalflow/core/constants.hpp"
#include "evalflow/pipeline/agent_invoker.hpp"
#include "evalflow/pipeline/context.hpp"
#include "evalflow/pipeline/pipeline_result.hpp"
#include "evalflow/pipeline/step.hpp"
#include "evalflow/sandbox/sandbox.hpp"
#include "evalflow/scheduler/task.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace evalflow {

/// Called after every step with the step's position in the pipeline.
/// Runs on whichever thread evaluates the sample.
using StepCallback =
    std::function<void(const SampleId &sample, std::size_t step_index,
                       std::size_t step_count, const StepResult &result)>;

/// Evaluates a pipeline definition against samples. Steps run strictly in
/// declared order against one PipelineContext per sample; the first failing
/// step ends that sample's run.
class PipelineRunner {
public:
  /// `agents` may be null, in which case agent flow steps fail. The invoker
  /// is called concurrently when samples run in parallel.
  explicit PipelineRunner(PipelineDefinition definition,
                          std::shared_ptr<const CodeSandbox> sandbox = nullptr,
                          std::shared_ptr<AgentInvoker> agents = nullptr);

  auto set_step_callback(StepCallback callback) -> void {
    on_step_ = std::move(callback);
  }

  [[nodiscard]] auto run_sample(const Sample &sample) const -> PipelineResult;

  /// One task per sample on a TaskScheduler. Results are in sample order.
  [[nodiscard]] auto
  run_samples(std::span<const Sample> samples,
              std::size_t max_workers = scheduler_defaults::kMaxWorkers,
              const ProgressCallback &on_progress = {}) const
      -> std::vector<PipelineResult>;

  [[nodiscard]] auto definition() const noexcept
      -> const PipelineDefinition & {
    return definition_;
  }

private:
  using StepOutcome = std::expected<JsonValue, std::string>;

  [[nodiscard]] auto execute_step(const StepConfig &step,
                                  PipelineContext &ctx) const -> StepResult;

  [[nodiscard]] auto run_batch(const StepConfig &step, const JsonValue &inputs,
                               TokenUsage &usage) const -> StepOutcome;

  [[nodiscard]] auto invoke(const StepConfig &step, const JsonValue &inputs,
                            TokenUsage &usage) const -> StepOutcome;

  PipelineDefinition definition_;
  std::shared_ptr<const CodeSandbox> sandbox_;
  std::shared_ptr<AgentInvoker> agents_;
  Aggregator aggregator_;
  StepCallback on_step_;
};

/// Builds a step's parameter object from its input mapping. A key missing
/// from the context binds an empty string.
[[nodiscard]] auto resolve_inputs(const StepConfig &step,
                                  const PipelineContext &ctx) -> JsonValue;

} // namespace evalflow
