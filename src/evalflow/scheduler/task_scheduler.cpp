#include "evalflow/scheduler/task_scheduler.hpp"

#include "evalflow/scheduler/dependency_graph.hpp"
#include "evalflow/util/log.hpp"
#include "evalflow/util/time.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/core/demangle.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <mutex>
#include <typeinfo>
#include <utility>

namespace evalflow {

namespace {

struct Completion {
  std::size_t index{0};
  TaskResult result;
};

// Workers push, the dispatch loop pops. The only state shared across threads
// during a run besides the task bodies themselves.
class CompletionQueue {
public:
  auto push(Completion completion) -> void {
    {
      std::scoped_lock lock(mu_);
      items_.push_back(std::move(completion));
    }
    cv_.notify_one();
  }

  [[nodiscard]] auto pop() -> Completion {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return !items_.empty(); });
    auto completion = std::move(items_.front());
    items_.pop_front();
    return completion;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Completion> items_;
};

// Worker boundary: nothing thrown by a task body gets past here.
[[nodiscard]] auto run_task(const Task &task) -> TaskResult {
  util::Stopwatch stopwatch;
  TaskResult result{.task_id = task.id, .required = task.required};
  if (!task.work) {
    result.error = "task has no work function";
    result.error_type = "InvalidTask";
    return result;
  }
  try {
    result.value = task.work(task.arguments);
    result.success = true;
  } catch (const std::exception &ex) {
    result.error = ex.what();
    result.error_type = boost::core::demangle(typeid(ex).name());
  } catch (...) {
    result.error = "non-standard exception";
    result.error_type = "unknown";
  }
  result.execution_time = stopwatch.elapsed_seconds();
  return result;
}

} // namespace

class TaskScheduler::DispatchLoop {
public:
  DispatchLoop(TaskScheduler &owner, std::vector<Task> &tasks,
               const ProgressCallback &on_progress)
      : owner_(owner), tasks_(tasks), on_progress_(on_progress),
        pool_(owner.max_workers_) {
    state_.total = tasks.size();
    state_.pending = tasks.size();
    publish();
  }

  DispatchLoop(const DispatchLoop &) = delete;
  DispatchLoop &operator=(const DispatchLoop &) = delete;

  ~DispatchLoop() { pool_.join(); }

  /// Runs `indices` with at most max_workers in flight, calling `on_done` on
  /// this thread as each one completes.
  auto run(std::span<const std::size_t> indices,
           const std::function<void(Completion)> &on_done) -> void {
    std::size_t next = 0;
    std::size_t done = 0;
    while (done < indices.size()) {
      while (next < indices.size() && state_.running < owner_.max_workers_) {
        dispatch(indices[next++]);
      }
      auto completion = queue_.pop();
      --state_.running;
      ++state_.completed;
      if (!completion.result.success) {
        ++state_.failed;
        log::warn("task {} failed: {}", completion.result.task_id,
                  completion.result.error.value_or("unknown error"));
      } else {
        log::debug("task {} finished in {:.3f}s", completion.result.task_id,
                   completion.result.execution_time);
      }
      publish();
      ++done;
      on_done(std::move(completion));
    }
  }

  /// Records a task that will never run.
  [[nodiscard]] auto skip(std::size_t index, const TaskId &blocked_by)
      -> TaskResult {
    const auto &task = tasks_[index];
    TaskResult result{.task_id = task.id,
                      .success = false,
                      .error = std::format(
                          "upstream dependency '{}' failed", blocked_by),
                      .skipped = true,
                      .error_type = "DependencyFailure",
                      .required = task.required};
    --state_.pending;
    ++state_.completed;
    ++state_.skipped;
    log::info("task {} skipped: {}", task.id, *result.error);
    publish();
    return result;
  }

private:
  auto dispatch(std::size_t index) -> void {
    --state_.pending;
    ++state_.running;
    log::debug("dispatch task {}", tasks_[index].id);
    boost::asio::post(pool_, [this, index] {
      queue_.push(Completion{.index = index, .result = run_task(tasks_[index])});
    });
    publish();
  }

  auto publish() -> void {
    state_.elapsed_time = stopwatch_.elapsed_seconds();
    if (state_.completed > 0) {
      state_.estimated_remaining_time =
          state_.elapsed_time / static_cast<double>(state_.completed) *
          static_cast<double>(state_.pending);
    } else {
      state_.estimated_remaining_time.reset();
    }
    {
      std::scoped_lock lock(owner_.progress_mu_);
      owner_.last_progress_ = state_;
    }
    if (!on_progress_) {
      return;
    }
    try {
      on_progress_(state_);
    } catch (const std::exception &ex) {
      log::warn("progress callback threw: {}", ex.what());
    }
  }

  TaskScheduler &owner_;
  std::vector<Task> &tasks_;
  const ProgressCallback &on_progress_;
  util::Stopwatch stopwatch_;
  ExecutionProgress state_;
  CompletionQueue queue_;
  boost::asio::thread_pool pool_;
};

TaskScheduler::TaskScheduler(std::size_t max_workers)
    : max_workers_(std::max<std::size_t>(1, max_workers)) {}

auto TaskScheduler::execute_concurrent(std::vector<Task> tasks,
                                       const ProgressCallback &on_progress)
    -> std::vector<TaskResult> {
  if (tasks.empty()) {
    return {};
  }
  log::info("execute_concurrent: {} tasks, max_workers={}", tasks.size(),
            max_workers_);

  std::vector<std::optional<TaskResult>> slots(tasks.size());
  std::vector<std::size_t> order(tasks.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }

  {
    DispatchLoop loop(*this, tasks, on_progress);
    loop.run(order, [&slots](Completion completion) {
      slots[completion.index] = std::move(completion.result);
    });
  }

  std::vector<TaskResult> results;
  results.reserve(slots.size());
  for (auto &slot : slots) {
    results.push_back(std::move(*slot));
  }
  return results;
}

auto TaskScheduler::execute_with_dependencies(
    std::vector<Task> tasks, const std::optional<DependencyMap> &graph,
    const ProgressCallback &on_progress) -> Result<std::vector<TaskResult>> {
  DependencyGraph dag;
  for (const auto &task : tasks) {
    if (auto r = dag.add_node(task.id); !r) {
      log::error("Duplicate task id '{}'", task.id);
      return fail(r.error());
    }
  }
  for (const auto &task : tasks) {
    const std::vector<TaskId> *deps = &task.dependencies;
    if (graph) {
      auto it = graph->find(task.id);
      deps = it == graph->end() ? nullptr : &it->second;
    }
    if (!deps) {
      continue;
    }
    for (const auto &dep : *deps) {
      if (auto r = dag.add_edge(dep, task.id); !r) {
        if (r.error() == make_error_code(Error::NotFound)) {
          log::error("Task '{}' depends on unknown task '{}'", task.id, dep);
        } else {
          log::error("Task '{}' cannot depend on itself", task.id);
        }
        return fail(r.error());
      }
    }
  }
  if (graph) {
    for (const auto &[id, deps] : *graph) {
      if (!dag.has_node(id)) {
        log::error("Dependency graph names unknown task '{}'", id);
        return fail(Error::NotFound);
      }
    }
  }

  std::vector<TaskId> cycle;
  if (auto valid = dag.is_valid(&cycle); !valid) {
    std::string path;
    for (const auto &id : cycle) {
      path += path.empty() ? id.str() : " -> " + id.str();
    }
    log::error("Circular dependency detected: {}", path);
    return fail(valid.error());
  }

  std::vector<TaskResult> results;
  results.reserve(tasks.size());
  if (tasks.empty()) {
    return ok(std::move(results));
  }
  log::info("execute_with_dependencies: {} tasks, max_workers={}",
            tasks.size(), max_workers_);

  std::vector<std::size_t> remaining(tasks.size());
  std::vector<std::optional<TaskId>> blocked_by(tasks.size());
  std::vector<std::size_t> wave;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    remaining[i] = dag.get_deps_view(static_cast<NodeIndex>(i)).size();
    if (remaining[i] == 0) {
      wave.push_back(i);
    }
  }

  DispatchLoop loop(*this, tasks, on_progress);
  std::size_t wave_number = 0;
  while (!wave.empty()) {
    std::vector<std::size_t> next_wave;
    auto finish = [&](std::size_t index, bool succeeded) {
      const auto &task = tasks[index];
      for (NodeIndex dependent :
           dag.get_dependents_view(static_cast<NodeIndex>(index))) {
        if (!succeeded && task.required && !blocked_by[dependent]) {
          blocked_by[dependent] = task.id;
        }
        if (--remaining[dependent] == 0) {
          next_wave.push_back(dependent);
        }
      }
    };

    std::vector<std::size_t> runnable;
    runnable.reserve(wave.size());
    for (auto index : wave) {
      if (blocked_by[index]) {
        results.push_back(loop.skip(index, *blocked_by[index]));
        finish(index, false);
      } else {
        runnable.push_back(index);
      }
    }

    log::debug("wave {}: {} runnable, {} skipped", wave_number,
               runnable.size(), wave.size() - runnable.size());
    loop.run(runnable, [&](Completion completion) {
      const bool succeeded = completion.result.success;
      results.push_back(std::move(completion.result));
      finish(completion.index, succeeded);
    });

    std::ranges::sort(next_wave);
    wave = std::move(next_wave);
    ++wave_number;
  }

  return ok(std::move(results));
}

auto TaskScheduler::progress() const -> ExecutionProgress {
  std::scoped_lock lock(progress_mu_);
  return last_progress_;
}

auto TaskScheduler::error_summary(std::span<const TaskResult> results)
    -> ErrorSummary {
  ErrorSummary summary;
  for (const auto &result : results) {
    if (result.success) {
      continue;
    }
    ++summary.total_errors;
    if (result.skipped) {
      summary.skipped_tasks.push_back(result.task_id);
    } else {
      summary.failed_tasks.push_back(result.task_id);
    }
    ++summary.error_types[result.error_type.value_or("unknown")];
    if (result.required && !result.skipped) {
      summary.critical_errors.push_back(std::format(
          "{}: {}", result.task_id, result.error.value_or("unknown error")));
    }
  }
  return summary;
}

} // namespace evalflow
