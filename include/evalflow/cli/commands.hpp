#pragma once

#include "evalflow/config/engine_config.hpp"
#include "evalflow/core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace evalflow::cli {

struct GlobalOptions {
  std::string config_file; // empty: built-in defaults plus EVALFLOW_* env
  std::optional<std::string> log_level;
};

struct ExecOptions {
  GlobalOptions global;
  std::string language{"python"};
  std::optional<std::string> code;
  std::optional<std::string> file;
  std::string inputs{"{}"};
  std::optional<int> timeout_sec;
  std::vector<std::string> env; // KEY=VALUE
  bool json{false};
};

struct AggregateOptions {
  GlobalOptions global;
  std::string strategy;
  std::optional<std::string> items;
  std::optional<std::string> items_file;
  std::optional<std::string> separator;
  std::vector<std::string> fields;
  std::optional<std::string> condition;
  std::optional<std::string> code;
  std::optional<std::string> code_file;
  std::string language{"python"};
  std::optional<int> timeout_sec;
  bool json{false};
};

struct ValidateOptions {
  GlobalOptions global;
  std::vector<std::string> files;
  bool json{false};
};

struct RunOptions {
  GlobalOptions global;
  std::string file;
  std::string inputs{"{}"};
  std::optional<std::string> inputs_file; // JSON object, or array of objects
  std::string sample_id{"sample"};
  std::optional<std::size_t> parallel;
  bool json{false};
};

/// Loads the engine config named by `opts` (defaults when none) and applies
/// its logging settings, with --log-level taking precedence.
[[nodiscard]] auto load_engine_config(const GlobalOptions &opts)
    -> Result<EngineConfig>;

auto cmd_exec(const ExecOptions &opts) -> int;
auto cmd_aggregate(const AggregateOptions &opts) -> int;
auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_run(const RunOptions &opts) -> int;

} // namespace evalflow::cli
