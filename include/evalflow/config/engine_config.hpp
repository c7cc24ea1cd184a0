#pragma once

#include "evalflow/core/constants.hpp"
#include "evalflow/sandbox/sandbox.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace evalflow {

struct SandboxConfig {
  std::string python_executable;
  std::string node_executable;
  std::chrono::seconds default_timeout{sandbox_defaults::kTimeout};
  std::chrono::milliseconds kill_grace{sandbox_defaults::kKillGrace};
  std::string temp_dir;

  [[nodiscard]] auto to_options() const -> SandboxOptions {
    return SandboxOptions{.python_executable = python_executable,
                          .node_executable = node_executable,
                          .kill_grace = kill_grace,
                          .temp_dir = temp_dir};
  }
};

struct SchedulerConfig {
  std::size_t max_workers{scheduler_defaults::kMaxWorkers};
  std::string log_level{"info"};
  std::string log_file;
};

struct BatchConfig {
  int batch_size{batch_defaults::kBatchSize};
  bool concurrent{batch_defaults::kConcurrent};
  std::size_t max_workers{batch_defaults::kMaxWorkers};
};

struct EngineConfig {
  SandboxConfig sandbox;
  SchedulerConfig scheduler;
  BatchConfig batch;
};

} // namespace evalflow
