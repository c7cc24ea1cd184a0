#include "evalflow/cli/commands.hpp"
#include "evalflow/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("EVALFLOW_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_global_options(CLI::App *cmd, evalflow::cli::GlobalOptions &opts,
                        const std::string &env_config) -> void {
  opts.config_file = env_config;
  cmd->add_option("-c,--config", opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  cmd->add_option("--log-level", opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep command output clean unless asked otherwise.
  evalflow::log::set_output_stderr();
  evalflow::log::set_level(evalflow::log::Level::Warn);

  CLI::App app{"evalflow", "Pipeline evaluation engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  evalflow exec -l python -e 'def transform(inputs): return 1'\n"
             "  evalflow run pipelines/review.toml --inputs '{\"text\":\"hi\"}'\n"
             "\nTip: Set EVALFLOW_CONFIG=engine.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  evalflow::cli::ExecOptions exec_opts;
  auto *exec = app.add_subcommand("exec", "Run one snippet in the sandbox");
  exec->footer("\nExamples:\n"
               "  evalflow exec -l python -e 'def main(inputs): return 42'\n"
               "  evalflow exec -l js -f transform.js -i '{\"x\": 1}' --json");
  add_global_options(exec, exec_opts.global, env_config);
  exec->add_option("-l,--language", exec_opts.language,
                   "python|javascript (aliases: py, js, node)");
  auto *exec_code =
      exec->add_option("-e,--code", exec_opts.code, "Inline source");
  auto *exec_file = exec->add_option("-f,--file", exec_opts.file, "Source file");
  exec_code->excludes(exec_file);
  exec->add_option("-i,--inputs", exec_opts.inputs, "Inputs as a JSON object");
  exec->add_option("-t,--timeout", exec_opts.timeout_sec, "Timeout in seconds");
  exec->add_option("--env", exec_opts.env, "KEY=VALUE, repeatable");
  exec->add_flag("--json", exec_opts.json, "Output JSON");
  exec->callback(
      [&exec_opts]() { std::exit(evalflow::cli::cmd_exec(exec_opts)); });

  evalflow::cli::AggregateOptions agg_opts;
  auto *aggregate =
      app.add_subcommand("aggregate", "Reduce a JSON array of items");
  aggregate->footer(
      "\nExamples:\n"
      "  evalflow aggregate -s concat -i '[\"a\",\"b\"]' --separator -\n"
      "  evalflow aggregate -s stats --items-file scores.json --field score\n"
      "  evalflow aggregate -s filter --items-file scores.json "
      "--condition 'score >= 80'");
  add_global_options(aggregate, agg_opts.global, env_config);
  aggregate
      ->add_option("-s,--strategy", agg_opts.strategy,
                   "concat|stats|filter|custom")
      ->required();
  auto *agg_items =
      aggregate->add_option("-i,--items", agg_opts.items, "JSON array");
  auto *agg_items_file = aggregate
                             ->add_option("--items-file", agg_opts.items_file,
                                          "File holding a JSON array")
                             ->check(CLI::ExistingFile);
  agg_items->excludes(agg_items_file);
  aggregate->add_option("--separator", agg_opts.separator,
                        "concat separator (default newline)");
  aggregate->add_option("--field", agg_opts.fields, "stats field, repeatable");
  aggregate->add_option("--condition", agg_opts.condition,
                        "filter condition, e.g. 'score >= 80'");
  auto *agg_code =
      aggregate->add_option("--code", agg_opts.code, "custom inline source");
  auto *agg_code_file = aggregate
                            ->add_option("--code-file", agg_opts.code_file,
                                         "custom source file")
                            ->check(CLI::ExistingFile);
  agg_code->excludes(agg_code_file);
  aggregate->add_option("-l,--language", agg_opts.language,
                        "custom code language");
  aggregate->add_option("-t,--timeout", agg_opts.timeout_sec,
                        "custom code timeout in seconds");
  aggregate->add_flag("--json", agg_opts.json, "Output JSON");
  aggregate->callback(
      [&agg_opts]() { std::exit(evalflow::cli::cmd_aggregate(agg_opts)); });

  evalflow::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate pipeline definition files");
  validate->footer("\nExamples:\n"
                   "  evalflow validate pipelines/review.toml\n"
                   "  evalflow validate pipelines/ --json");
  add_global_options(validate, validate_opts.global, env_config);
  validate
      ->add_option("files", validate_opts.files,
                   "Pipeline TOML files or directories")
      ->required()
      ->check(CLI::ExistingPath);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(evalflow::cli::cmd_validate(validate_opts));
  });

  evalflow::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run a pipeline over samples");
  run->footer("\nExamples:\n"
              "  evalflow run pipelines/review.toml --inputs '{\"text\":\"hi\"}'\n"
              "  evalflow run pipelines/review.toml --inputs-file samples.json "
              "--parallel 8 --json");
  add_global_options(run, run_opts.global, env_config);
  run->add_option("file", run_opts.file, "Pipeline TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  auto *run_inputs = run->add_option("--inputs", run_opts.inputs,
                                     "Sample inputs as a JSON object");
  auto *run_inputs_file =
      run->add_option("--inputs-file", run_opts.inputs_file,
                      "JSON object or array of objects, one per sample")
          ->check(CLI::ExistingFile);
  run_inputs->excludes(run_inputs_file);
  run->add_option("--sample-id", run_opts.sample_id, "Sample id prefix");
  run->add_option("--parallel", run_opts.parallel,
                  "Samples evaluated at once (default: scheduler.max_workers)");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback([&run_opts]() { std::exit(evalflow::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
