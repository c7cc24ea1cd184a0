#include "evalflow/cli/commands.hpp"
#include "evalflow/cli/formatting.hpp"
#include "evalflow/sandbox/sandbox.hpp"
#include "evalflow/util/json.hpp"
#include "evalflow/util/log.hpp"

#include <print>

namespace evalflow::cli {

namespace {

[[nodiscard]] auto parse_env_pairs(const std::vector<std::string> &pairs)
    -> Result<EnvVars> {
  EnvVars env;
  for (const auto &pair : pairs) {
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::println(stderr, "Error: --env expects KEY=VALUE, got '{}'", pair);
      return fail(Error::InvalidArgument);
    }
    env.insert_or_assign(pair.substr(0, eq), pair.substr(eq + 1));
  }
  return ok(std::move(env));
}

auto print_result(const ExecutionResult &result) -> void {
  if (result.success) {
    std::println("{}", dump_json(result.output));
    std::println(stderr, "{} {}", fmt::status_label(true),
                 fmt::ansi::dim(fmt::format_seconds(result.execution_time)));
    return;
  }
  std::println(stderr, "{} {}", fmt::status_label(false),
               result.error.value_or("unknown error"));
  if (result.stack_trace) {
    fmt::print_indented(stderr, *result.stack_trace);
  } else if (result.stderr_output && !result.stderr_output->empty()) {
    fmt::print_indented(stderr, *result.stderr_output);
  }
}

} // namespace

auto cmd_exec(const ExecOptions &opts) -> int {
  auto config = load_engine_config(opts.global);
  if (!config) {
    return 1;
  }

  auto inputs = parse_json(opts.inputs);
  if (!inputs || !inputs->is_object()) {
    std::println(stderr, "Error: --inputs must be a JSON object");
    return 1;
  }
  auto env = parse_env_pairs(opts.env);
  if (!env) {
    return 1;
  }

  auto builder =
      CodeSpec::builder()
          .language(std::string_view(opts.language))
          .timeout(opts.timeout_sec ? std::chrono::seconds(*opts.timeout_sec)
                                    : config->sandbox.default_timeout)
          .env(std::move(*env));
  if (opts.code) {
    std::move(builder).code(*opts.code);
  }
  if (opts.file) {
    std::move(builder).code_file(*opts.file);
  }
  auto spec = std::move(builder).build();
  if (!spec) {
    std::println(stderr, "Error: {}", spec.error().message());
    return 1;
  }

  CodeSandbox sandbox(config->sandbox.to_options());
  auto result = sandbox.execute(*spec, *inputs);
  if (opts.json) {
    std::println("{}", dump_json(to_json(result)));
  } else {
    print_result(result);
  }
  return result.success ? 0 : 1;
}

} // namespace evalflow::cli
