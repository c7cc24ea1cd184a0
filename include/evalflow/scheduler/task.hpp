#pragma once

#include "evalflow/util/id.hpp"
#include "evalflow/util/json.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace evalflow {

/// Unit of work. `work` is called once with `arguments`; throwing marks the
/// task failed.
struct Task {
  TaskId id;
  std::function<JsonValue(const JsonValue &)> work;
  JsonValue arguments{};
  std::vector<TaskId> dependencies;
  // A failed non-required dependency does not block its dependents.
  bool required{true};
};

struct TaskResult {
  TaskId task_id;
  bool success{false};
  JsonValue value{};
  std::optional<std::string> error;
  double execution_time{0.0};
  bool skipped{false};
  std::optional<std::string> error_type;
  bool required{true};
};

struct ExecutionProgress {
  std::size_t total{0};
  std::size_t completed{0};
  std::size_t running{0};
  std::size_t pending{0};
  std::size_t failed{0};
  std::size_t skipped{0};
  double elapsed_time{0.0};
  std::optional<double> estimated_remaining_time;

  [[nodiscard]] auto completion_rate() const noexcept -> double {
    return total == 0 ? 0.0
                      : static_cast<double>(completed) /
                            static_cast<double>(total);
  }

  // `completed` counts every finished task: succeeded, failed or skipped.
  [[nodiscard]] auto success_rate() const noexcept -> double {
    return completed == 0 ? 0.0
                          : static_cast<double>(completed - failed - skipped) /
                                static_cast<double>(completed);
  }
};

struct ErrorSummary {
  std::size_t total_errors{0};
  std::vector<TaskId> failed_tasks;
  std::vector<TaskId> skipped_tasks;
  std::map<std::string, std::size_t, std::less<>> error_types;
  // Failures of tasks marked required.
  std::vector<std::string> critical_errors;
};

using ProgressCallback = std::function<void(const ExecutionProgress &)>;

} // namespace evalflow
