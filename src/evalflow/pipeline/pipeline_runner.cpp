#include "evalflow/pipeline/pipeline_runner.hpp"

#include "evalflow/batch/batch_processor.hpp"
#include "evalflow/scheduler/task_scheduler.hpp"
#include "evalflow/util/log.hpp"
#include "evalflow/util/time.hpp"

#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace evalflow {

namespace {

using StepOutcome = std::expected<JsonValue, std::string>;

[[nodiscard]] auto list_param(const JsonValue &inputs, std::string_view name)
    -> std::vector<JsonValue> {
  const auto *value = find_member(inputs, name);
  if (value == nullptr || !value->is_array()) {
    return {};
  }
  const auto &arr = value->get_array();
  return {arr.begin(), arr.end()};
}

struct StepVisitor {
  const CodeSandbox &sandbox;
  AgentInvoker *agents;
  const Aggregator &aggregator;
  const JsonValue &inputs;
  TokenUsage &usage;

  auto operator()(const AgentFlowStep &step) const -> StepOutcome {
    if (agents == nullptr) {
      return std::unexpected(
          std::format("no agent invoker configured for agent '{}'", step.agent));
    }
    AgentRequest request{.agent = step.agent,
                         .flow = step.flow,
                         .inputs = inputs,
                         .model_override = step.model_override};
    auto response = agents->invoke(request);
    if (!response) {
      return std::unexpected(std::format("agent '{}' flow '{}' failed: {}",
                                         step.agent, step.flow,
                                         response.error().message()));
    }
    usage += response->usage;
    return std::move(response->output);
  }

  auto operator()(const CodeNodeStep &step) const -> StepOutcome {
    auto result = sandbox.execute(step.code, inputs);
    if (!result.success) {
      return std::unexpected(result.describe());
    }
    return std::move(result.output);
  }

  auto operator()(const BatchAggregatorStep &step) const -> StepOutcome {
    auto items = list_param(inputs, "items");
    auto result = aggregator.aggregate(items, step.strategy, step.params);
    if (!result.success) {
      auto message = result.error.value_or("aggregation failed");
      if (result.stack_trace) {
        message += "\n" + *result.stack_trace;
      }
      return std::unexpected(std::move(message));
    }
    return std::move(result.result);
  }
};

} // namespace

auto resolve_inputs(const StepConfig &step, const PipelineContext &ctx)
    -> JsonValue {
  JsonValue inputs = make_object();
  auto &obj = inputs.get_object();
  for (const auto &binding : step.input_mapping) {
    const auto *value = ctx.get(binding.context_key);
    if (value == nullptr) {
      log::warn("step '{}': context key '{}' not found, binding '{}' to \"\"",
                step.id, binding.context_key, binding.param);
      obj.insert_or_assign(binding.param, std::string{});
      continue;
    }
    obj.insert_or_assign(binding.param, *value);
  }
  return inputs;
}

PipelineRunner::PipelineRunner(PipelineDefinition definition,
                               std::shared_ptr<const CodeSandbox> sandbox,
                               std::shared_ptr<AgentInvoker> agents)
    : definition_(std::move(definition)),
      sandbox_(sandbox ? std::move(sandbox)
                       : std::make_shared<const CodeSandbox>()),
      agents_(std::move(agents)), aggregator_(sandbox_) {}

auto PipelineRunner::invoke(const StepConfig &step, const JsonValue &inputs,
                            TokenUsage &usage) const -> StepOutcome {
  return std::visit(StepVisitor{.sandbox = *sandbox_,
                                .agents = agents_.get(),
                                .aggregator = aggregator_,
                                .inputs = inputs,
                                .usage = usage},
                    step.kind);
}

auto PipelineRunner::run_batch(const StepConfig &step, const JsonValue &inputs,
                               TokenUsage &usage) const -> StepOutcome {
  const auto &opts = *step.batch;
  const auto *list = find_member(inputs, opts.items_param);
  if (list == nullptr || !list->is_array()) {
    return std::unexpected(std::format(
        "batch step '{}': parameter '{}' is not a list", step.id,
        opts.items_param));
  }
  const auto &arr = list->get_array();
  std::vector<JsonValue> items(arr.begin(), arr.end());

  std::mutex usage_mu;
  auto processor = [&](const JsonValue &item) -> JsonValue {
    JsonValue args = inputs;
    args.get_object().insert_or_assign("item", item);
    TokenUsage item_usage;
    auto outcome = invoke(step, args, item_usage);
    {
      std::scoped_lock lock(usage_mu);
      usage += item_usage;
    }
    if (!outcome) {
      throw std::runtime_error(outcome.error());
    }
    return std::move(*outcome);
  };

  BatchProcessor batcher(opts.max_workers);
  auto result = batcher.process_in_batches_detailed(
      items, processor, opts.batch_size, opts.concurrent);
  if (!result.success) {
    return std::unexpected(result.error.value_or("batch processing failed"));
  }
  if (!result.failed_indices.empty()) {
    log::warn("batch step '{}': {} of {} items failed", step.id,
              result.failed_indices.size(), result.total_items);
  }
  return make_array(std::move(result.results));
}

auto PipelineRunner::execute_step(const StepConfig &step,
                                  PipelineContext &ctx) const -> StepResult {
  util::Stopwatch stopwatch;
  StepResult result{.step_id = step.id, .output_key = step.output_key};
  log::info("step '{}' ({}) starting", step.id,
            to_string_view(step_type(step.kind)));

  auto inputs = resolve_inputs(step, ctx);
  StepOutcome outcome;
  try {
    outcome = step.batch ? run_batch(step, inputs, result.token_usage)
                         : invoke(step, inputs, result.token_usage);
  } catch (const std::exception &ex) {
    outcome = std::unexpected(std::string(ex.what()));
  }

  if (outcome) {
    if (auto r = ctx.set(step.output_key, *outcome); r) {
      result.success = true;
      result.output_value = std::move(*outcome);
    } else {
      result.error = std::format("context key '{}' already set", step.output_key);
    }
  } else {
    result.error = std::move(outcome.error());
  }

  result.execution_time = stopwatch.elapsed_seconds();
  if (result.success) {
    log::info("step '{}' finished in {:.3f}s", step.id, result.execution_time);
  } else {
    log::error("step '{}' failed: {}", step.id, *result.error);
  }
  return result;
}

auto PipelineRunner::run_sample(const Sample &sample) const -> PipelineResult {
  util::Stopwatch stopwatch;
  PipelineResult result{.sample_id = sample.id};

  auto ctx = PipelineContext::from_inputs(sample.inputs);
  if (!ctx) {
    result.error = std::format("sample '{}': inputs must be a JSON object "
                               "with unique keys",
                               sample.id);
    result.final_outputs = make_object();
    return result;
  }

  log::info("pipeline '{}' running sample '{}' ({} steps)", definition_.id,
            sample.id, definition_.steps.size());
  const auto step_count = definition_.steps.size();
  result.success = true;
  for (std::size_t i = 0; i < step_count; ++i) {
    const auto &step = definition_.steps[i];
    auto step_result = execute_step(step, *ctx);
    result.total_token_usage += step_result.token_usage;
    if (on_step_) {
      on_step_(sample.id, i, step_count, step_result);
    }
    const bool ok_step = step_result.success;
    result.step_results.push_back(std::move(step_result));
    if (!ok_step) {
      result.success = false;
      result.error = std::format("step '{}' failed: {}", step.id,
                                 *result.step_results.back().error);
      break;
    }
  }

  result.final_outputs = ctx->snapshot();
  result.total_execution_time = stopwatch.elapsed_seconds();
  log::info("sample '{}' {} in {:.3f}s", sample.id,
            result.success ? "succeeded" : "failed",
            result.total_execution_time);
  return result;
}

auto PipelineRunner::run_samples(std::span<const Sample> samples,
                                 std::size_t max_workers,
                                 const ProgressCallback &on_progress) const
    -> std::vector<PipelineResult> {
  std::vector<std::optional<PipelineResult>> slots(samples.size());
  std::vector<Task> tasks;
  tasks.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    tasks.push_back(Task{
        .id = TaskId{std::format("sample_{}_{}", i, samples[i].id)},
        .work = [this, &samples, &slots, i](const JsonValue &) -> JsonValue {
          slots[i] = run_sample(samples[i]);
          return JsonValue(slots[i]->success);
        },
    });
  }

  TaskScheduler scheduler(max_workers);
  auto task_results = scheduler.execute_concurrent(std::move(tasks), on_progress);

  std::vector<PipelineResult> results;
  results.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (slots[i]) {
      results.push_back(std::move(*slots[i]));
      continue;
    }
    PipelineResult failed{.sample_id = samples[i].id};
    failed.error = task_results[i].error.value_or("sample did not run");
    failed.final_outputs = make_object();
    results.push_back(std::move(failed));
  }
  return results;
}

} // namespace evalflow
