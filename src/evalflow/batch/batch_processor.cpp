#include "evalflow/batch/batch_processor.hpp"

#include "evalflow/scheduler/task_scheduler.hpp"
#include "evalflow/util/log.hpp"
#include "evalflow/util/time.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace evalflow {

namespace {

struct BatchRange {
  std::size_t begin{0};
  std::size_t end{0};
};

[[nodiscard]] auto partition(std::size_t count, std::size_t batch_size)
    -> std::vector<BatchRange> {
  std::vector<BatchRange> ranges;
  ranges.reserve((count + batch_size - 1) / batch_size);
  for (std::size_t begin = 0; begin < count; begin += batch_size) {
    ranges.push_back({begin, std::min(count, begin + batch_size)});
  }
  return ranges;
}

// Runs one batch into its slots of `results`; a throwing item leaves its slot
// null and the rest of the batch still runs.
auto process_range(std::span<const JsonValue> items, BatchRange range,
                   const ItemProcessor &processor,
                   std::vector<JsonValue> &results,
                   std::vector<char> &failed) -> void {
  for (std::size_t i = range.begin; i < range.end; ++i) {
    try {
      results[i] = processor(items[i]);
    } catch (const std::exception &ex) {
      log::warn("batch item {} failed: {}", i, ex.what());
      results[i] = JsonValue{};
      failed[i] = 1;
    } catch (...) {
      log::warn("batch item {} failed: non-standard exception", i);
      results[i] = JsonValue{};
      failed[i] = 1;
    }
  }
}

} // namespace

BatchProcessor::BatchProcessor(std::size_t max_workers)
    : max_workers_(std::max<std::size_t>(1, max_workers)) {}

auto BatchProcessor::run(std::span<const JsonValue> items,
                         const ItemProcessor &processor,
                         std::size_t batch_size, bool concurrent) const
    -> Outcome {
  Outcome outcome;
  outcome.results.assign(items.size(), JsonValue{});
  std::vector<char> failed(items.size(), 0);
  const auto ranges = partition(items.size(), batch_size);
  outcome.batch_count = ranges.size();

  if (!concurrent || ranges.size() <= 1) {
    for (const auto &range : ranges) {
      process_range(items, range, processor, outcome.results, failed);
    }
  } else {
    // Each task writes only its own disjoint slice of `results`/`failed`.
    std::vector<Task> tasks;
    tasks.reserve(ranges.size());
    for (std::size_t b = 0; b < ranges.size(); ++b) {
      tasks.push_back(Task{
          .id = TaskId{std::format("batch_{}", b)},
          .work = [&, range = ranges[b]](const JsonValue &) -> JsonValue {
            process_range(items, range, processor, outcome.results, failed);
            return JsonValue{};
          },
      });
    }
    TaskScheduler scheduler(std::min(max_workers_, ranges.size()));
    auto task_results = scheduler.execute_concurrent(std::move(tasks));
    for (std::size_t b = 0; b < task_results.size(); ++b) {
      if (task_results[b].success) {
        continue;
      }
      log::warn("batch {} failed: {}", b,
                task_results[b].error.value_or("unknown error"));
      for (std::size_t i = ranges[b].begin; i < ranges[b].end; ++i) {
        outcome.results[i] = JsonValue{};
        failed[i] = 1;
      }
    }
  }

  for (std::size_t i = 0; i < failed.size(); ++i) {
    if (failed[i] != 0) {
      outcome.failed_indices.push_back(i);
    }
  }
  return outcome;
}

auto BatchProcessor::process_in_batches(std::span<const JsonValue> items,
                                        const ItemProcessor &processor,
                                        int batch_size, bool concurrent) const
    -> Result<std::vector<JsonValue>> {
  if (batch_size < 1) {
    log::error("Invalid batch size {}", batch_size);
    return fail(Error::InvalidBatchSize);
  }
  auto outcome = run(items, processor, static_cast<std::size_t>(batch_size),
                     concurrent);
  return ok(std::move(outcome.results));
}

auto BatchProcessor::process_in_batches_detailed(
    std::span<const JsonValue> items, const ItemProcessor &processor,
    int batch_size, bool concurrent) const -> BatchProcessingResult {
  util::Stopwatch stopwatch;
  BatchProcessingResult result;
  result.total_items = items.size();
  if (batch_size < 1) {
    result.error = std::format("batch size must be a positive integer, got {}",
                               batch_size);
    result.execution_time = stopwatch.elapsed_seconds();
    return result;
  }

  auto outcome = run(items, processor, static_cast<std::size_t>(batch_size),
                     concurrent);
  result.success = true;
  result.results = std::move(outcome.results);
  result.batch_count = outcome.batch_count;
  result.failed_indices = std::move(outcome.failed_indices);
  result.execution_time = stopwatch.elapsed_seconds();
  log::debug("processed {} items in {} batches ({} failed) in {:.3f}s",
             result.total_items, result.batch_count,
             result.failed_indices.size(), result.execution_time);
  return result;
}

} // namespace evalflow
