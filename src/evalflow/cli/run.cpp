#include "evalflow/cli/commands.hpp"
#include "evalflow/cli/formatting.hpp"
#include "evalflow/config/pipeline_definition.hpp"
#include "evalflow/config/toml_util.hpp"
#include "evalflow/pipeline/pipeline_runner.hpp"
#include "evalflow/util/json.hpp"
#include "evalflow/util/log.hpp"

#include <format>
#include <memory>
#include <print>

namespace evalflow::cli {

namespace {

// --inputs-file may hold one object or an array of objects (one sample each).
[[nodiscard]] auto load_samples(const RunOptions &opts)
    -> Result<std::vector<Sample>> {
  std::string text = opts.inputs;
  if (opts.inputs_file) {
    auto file = toml_util::read_file(*opts.inputs_file);
    if (!file) {
      std::println(stderr, "Error: cannot read {}: {}", *opts.inputs_file,
                   file.error().message());
      return fail(file.error());
    }
    text = std::move(*file);
  }
  auto parsed = parse_json(text);
  if (!parsed) {
    std::println(stderr, "Error: sample inputs are not valid JSON");
    return fail(parsed.error());
  }

  std::vector<Sample> samples;
  if (parsed->is_array()) {
    const auto &arr = parsed->get_array();
    for (std::size_t i = 0; i < arr.size(); ++i) {
      samples.push_back(Sample{
          .id = SampleId{std::format("{}_{}", opts.sample_id, i)},
          .inputs = arr[i]});
    }
  } else {
    samples.push_back(
        Sample{.id = SampleId{opts.sample_id}, .inputs = std::move(*parsed)});
  }
  return ok(std::move(samples));
}

auto print_result(const PipelineResult &result) -> void {
  std::println("{} sample {} {}", fmt::status_label(result.success),
               fmt::ansi::bold(result.sample_id.str()),
               fmt::ansi::dim(fmt::format_seconds(result.total_execution_time)));
  fmt::Table table({{.header = "STEP", .width = 20},
                    {.header = "STATUS", .width = 8},
                    {.header = "TIME", .width = 10, .right_align = true},
                    {.header = "OUTPUT KEY", .width = 20}});
  table.print_header();
  for (const auto &step : result.step_results) {
    table.print_row({step.step_id.str(), fmt::status_label(step.success),
                     fmt::format_seconds(step.execution_time),
                     step.output_key});
  }
  if (result.error) {
    std::println("");
    fmt::print_indented(stdout, *result.error, "  ");
  } else {
    std::println("\n{}", dump_json(result.final_outputs));
  }
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config = load_engine_config(opts.global);
  if (!config) {
    return 1;
  }

  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_file(opts.file, &diagnostic);
  if (!def) {
    std::println(stderr, "Error: {}: {}", opts.file,
                 diagnostic.empty() ? def.error().message() : diagnostic);
    return 1;
  }
  auto samples = load_samples(opts);
  if (!samples) {
    return 1;
  }

  PipelineRunner runner(
      std::move(*def),
      std::make_shared<const CodeSandbox>(config->sandbox.to_options()));
  auto results = runner.run_samples(
      *samples, opts.parallel.value_or(config->scheduler.max_workers));

  bool all_ok = true;
  for (const auto &result : results) {
    all_ok = all_ok && result.success;
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &result : results) {
      arr.get_array().emplace_back(to_json(result));
    }
    std::println("{}", dump_json(results.size() == 1 ? arr.get_array().front()
                                                     : arr));
  } else {
    for (const auto &result : results) {
      print_result(result);
    }
  }
  return all_ok ? 0 : 1;
}

} // namespace evalflow::cli
