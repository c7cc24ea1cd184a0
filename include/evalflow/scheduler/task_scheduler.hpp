#pragma once

#include "evalflow/core/constants.hpp"
#include "evalflow/core/error.hpp"
#include "evalflow/scheduler/task.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace evalflow {

using DependencyMap = std::map<TaskId, std::vector<TaskId>>;

/// Runs tasks on a bounded thread pool. Workers only execute task bodies;
/// the calling thread runs the dispatch loop, owns the progress counters and
/// invokes the progress callback.
class TaskScheduler {
public:
  explicit TaskScheduler(
      std::size_t max_workers = scheduler_defaults::kMaxWorkers);

  /// All tasks, no ordering. Results are in submission order.
  [[nodiscard]] auto execute_concurrent(std::vector<Task> tasks,
                                        const ProgressCallback &on_progress = {})
      -> std::vector<TaskResult>;

  /// Runs tasks in eligibility waves: a wave holds every task whose
  /// dependencies have all finished, and the next wave starts when it drains.
  /// `graph`, when given, replaces each task's own dependency list. Tasks
  /// behind a failed required dependency are skipped. Results are in
  /// completion order. Unknown ids, duplicates and cycles are rejected before
  /// anything runs.
  [[nodiscard]] auto
  execute_with_dependencies(std::vector<Task> tasks,
                            const std::optional<DependencyMap> &graph = {},
                            const ProgressCallback &on_progress = {})
      -> Result<std::vector<TaskResult>>;

  /// Snapshot published by the most recent dispatch loop.
  [[nodiscard]] auto progress() const -> ExecutionProgress;

  [[nodiscard]] auto max_workers() const noexcept -> std::size_t {
    return max_workers_;
  }

  [[nodiscard]] static auto error_summary(std::span<const TaskResult> results)
      -> ErrorSummary;

private:
  class DispatchLoop;

  std::size_t max_workers_;
  mutable std::mutex progress_mu_;
  ExecutionProgress last_progress_;
};

} // namespace evalflow
