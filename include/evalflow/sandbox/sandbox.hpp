#pragma once

#include "evalflow/core/constants.hpp"
#include "evalflow/sandbox/code_spec.hpp"
#include "evalflow/sandbox/execution_result.hpp"
#include "evalflow/util/json.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace evalflow {

struct SandboxOptions {
  // Empty: search PATH (python3, then python / node).
  std::string python_executable;
  std::string node_executable;
  std::chrono::milliseconds kill_grace{sandbox_defaults::kKillGrace};
  std::chrono::milliseconds pipe_drain{sandbox_defaults::kPipeDrain};
  // Empty: std::filesystem::temp_directory_path().
  std::filesystem::path temp_dir;
};

/// Runs snippets in single-use interpreter processes. Every call owns its own
/// io_context, so one sandbox may be shared by any number of threads.
class CodeSandbox {
public:
  explicit CodeSandbox(SandboxOptions options = {});

  [[nodiscard]] auto execute(Language language, std::string_view code,
                             const JsonValue &inputs,
                             std::chrono::seconds timeout,
                             const EnvVars &env = {}) const -> ExecutionResult;

  /// Same as execute() with the code read from `path`. A missing or
  /// unreadable file is reported in the result.
  [[nodiscard]] auto execute_file(const std::filesystem::path &path,
                                  Language language, const JsonValue &inputs,
                                  std::chrono::seconds timeout,
                                  const EnvVars &env = {}) const
      -> ExecutionResult;

  [[nodiscard]] auto execute(const CodeSpec &spec,
                             const JsonValue &inputs) const -> ExecutionResult;

  [[nodiscard]] auto find_interpreter(Language language) const
      -> std::optional<std::filesystem::path>;

  [[nodiscard]] auto options() const noexcept -> const SandboxOptions & {
    return options_;
  }

private:
  SandboxOptions options_;
};

} // namespace evalflow
