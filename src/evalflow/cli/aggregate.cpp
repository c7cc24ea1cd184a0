#include "evalflow/batch/aggregator.hpp"
#include "evalflow/batch/filter_condition.hpp"
#include "evalflow/cli/commands.hpp"
#include "evalflow/cli/formatting.hpp"
#include "evalflow/config/toml_util.hpp"
#include "evalflow/util/json.hpp"

#include <memory>
#include <print>

namespace evalflow::cli {

namespace {

[[nodiscard]] auto load_items(const AggregateOptions &opts)
    -> Result<std::vector<JsonValue>> {
  std::string text = opts.items.value_or("[]");
  if (opts.items_file) {
    auto file = toml_util::read_file(*opts.items_file);
    if (!file) {
      std::println(stderr, "Error: cannot read {}: {}", *opts.items_file,
                   file.error().message());
      return fail(file.error());
    }
    text = std::move(*file);
  }
  auto parsed = parse_json(text);
  if (!parsed || !parsed->is_array()) {
    std::println(stderr, "Error: items must be a JSON array");
    return fail(Error::ParseError);
  }
  const auto &arr = parsed->get_array();
  return ok(std::vector<JsonValue>(arr.begin(), arr.end()));
}

[[nodiscard]] auto build_params(const AggregateOptions &opts,
                                std::chrono::seconds default_timeout)
    -> Result<AggregationParams> {
  AggregationParams params;
  if (opts.separator) {
    params.separator = *opts.separator;
  }
  params.fields = opts.fields;
  if (opts.condition) {
    auto condition = FilterCondition::parse(*opts.condition);
    if (!condition) {
      std::println(stderr, "Error: invalid condition '{}'", *opts.condition);
      return fail(condition.error());
    }
    params.condition = condition->predicate();
  }
  if (opts.code || opts.code_file) {
    auto builder = CodeSpec::builder()
                       .language(std::string_view(opts.language))
                       .timeout(opts.timeout_sec
                                    ? std::chrono::seconds(*opts.timeout_sec)
                                    : default_timeout);
    if (opts.code) {
      std::move(builder).code(*opts.code);
    }
    if (opts.code_file) {
      std::move(builder).code_file(*opts.code_file);
    }
    auto spec = std::move(builder).build();
    if (!spec) {
      std::println(stderr, "Error: {}", spec.error().message());
      return fail(spec.error());
    }
    params.code = std::move(*spec);
  }
  return ok(std::move(params));
}

} // namespace

auto cmd_aggregate(const AggregateOptions &opts) -> int {
  auto config = load_engine_config(opts.global);
  if (!config) {
    return 1;
  }
  auto items = load_items(opts);
  if (!items) {
    return 1;
  }
  auto params = build_params(opts, config->sandbox.default_timeout);
  if (!params) {
    return 1;
  }

  Aggregator aggregator(
      std::make_shared<const CodeSandbox>(config->sandbox.to_options()));
  auto result = aggregator.aggregate(*items, opts.strategy, *params);
  if (!result) {
    std::println(stderr, "Error: unknown aggregation strategy '{}'",
                 opts.strategy);
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(to_json(*result)));
  } else if (result->success) {
    std::println("{}", stringify(result->result));
    std::println(stderr, "{} {} items via {}", fmt::status_label(true),
                 result->item_count, to_string_view(result->strategy));
  } else {
    std::println(stderr, "{} {}", fmt::status_label(false),
                 result->error.value_or("unknown error"));
    if (result->stack_trace) {
      fmt::print_indented(stderr, *result->stack_trace);
    }
  }
  return result->success ? 0 : 1;
}

} // namespace evalflow::cli
