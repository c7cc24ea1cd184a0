#include "evalflow/batch/aggregator.hpp"

#include "evalflow/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <format>
#include <numeric>
#include <utility>

namespace evalflow {

namespace {

constexpr std::array<std::string_view, 3> kTextFields{"text", "output",
                                                      "result"};

[[nodiscard]] auto project_text(const JsonValue &item) -> std::string {
  if (const auto *text = item.get_if<std::string>()) {
    return *text;
  }
  for (auto key : kTextFields) {
    if (const auto *member = find_member(item, key)) {
      return stringify(*member);
    }
  }
  return dump_json(item);
}

[[nodiscard]] auto median_of(std::vector<double> values) -> double {
  std::ranges::sort(values);
  const auto mid = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[mid];
  }
  return (values[mid - 1] + values[mid]) / 2.0;
}

[[nodiscard]] auto sample_stdev(std::span<const double> values, double mean)
    -> double {
  double acc = 0.0;
  for (double v : values) {
    acc += (v - mean) * (v - mean);
  }
  return std::sqrt(acc / static_cast<double>(values.size() - 1));
}

[[nodiscard]] auto field_stats(std::span<const JsonValue> items,
                               const std::string &field) -> JsonValue {
  std::vector<double> values;
  values.reserve(items.size());
  for (const auto &item : items) {
    if (const auto *member = find_member(item, field)) {
      if (auto number = as_number(*member)) {
        values.push_back(*number);
      }
    }
  }

  JsonValue out = make_object();
  auto &obj = out.get_object();
  obj.emplace("count", static_cast<std::int64_t>(values.size()));
  if (values.empty()) {
    log::warn("No numeric values found for field '{}'", field);
    obj.emplace("error", std::string("No numeric values found"));
    return out;
  }

  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  const double mean = sum / static_cast<double>(values.size());
  obj.emplace("sum", make_number(sum));
  obj.emplace("mean", make_number(mean));
  obj.emplace("min", make_number(std::ranges::min(values)));
  obj.emplace("max", make_number(std::ranges::max(values)));
  if (values.size() >= 2) {
    obj.emplace("stdev", JsonValue(sample_stdev(values, mean)));
    obj.emplace("median", make_number(median_of(std::move(values))));
  }
  log::debug("stats for '{}': mean={:.2f}", field, mean);
  return out;
}

} // namespace

auto parse_strategy(std::string_view name) -> Result<AggregationStrategy> {
  if (auto strategy = util::try_parse_enum<AggregationStrategy>(name)) {
    return ok(*strategy);
  }
  log::error("Unknown aggregation strategy '{}'", name);
  return fail(Error::UnknownStrategy);
}

auto to_json(const AggregationResult &result) -> JsonValue {
  JsonValue out{{"success", result.success},
                {"result", result.result},
                {"strategy", std::string(to_string_view(result.strategy))},
                {"item_count", static_cast<std::int64_t>(result.item_count)}};
  auto &obj = out.get_object();
  obj.emplace("error", result.error ? JsonValue(*result.error) : JsonValue{});
  if (result.stack_trace) {
    obj.emplace("stack_trace", *result.stack_trace);
  }
  return out;
}

Aggregator::Aggregator(std::shared_ptr<const CodeSandbox> sandbox)
    : sandbox_(sandbox ? std::move(sandbox)
                       : std::make_shared<const CodeSandbox>()) {}

auto Aggregator::aggregate(std::span<const JsonValue> items,
                           AggregationStrategy strategy,
                           const AggregationParams &params) const
    -> AggregationResult {
  AggregationResult result{.strategy = strategy, .item_count = items.size()};
  if (items.empty()) {
    log::warn("Empty item list for {} aggregation", to_string_view(strategy));
    result.success = true;
    return result;
  }

  log::info("Aggregating {} items with strategy '{}'", items.size(),
            to_string_view(strategy));
  Outcome outcome;
  try {
    switch (strategy) {
    case AggregationStrategy::Concat:
      outcome = concat(items, params.separator);
      break;
    case AggregationStrategy::Stats:
      outcome = stats(items, params.fields);
      break;
    case AggregationStrategy::Filter:
      outcome = filter(items, params.condition);
      break;
    case AggregationStrategy::Custom:
      outcome = custom(items, params.code);
      break;
    }
  } catch (const std::exception &ex) {
    outcome = std::unexpected(Fault{.message = ex.what()});
  }

  if (!outcome) {
    log::error("Aggregation failed with strategy '{}': {}",
               to_string_view(strategy), outcome.error().message);
    result.error = std::move(outcome.error().message);
    result.stack_trace = std::move(outcome.error().stack_trace);
    return result;
  }
  result.success = true;
  result.result = std::move(*outcome);
  return result;
}

auto Aggregator::aggregate(std::span<const JsonValue> items,
                           std::string_view strategy,
                           const AggregationParams &params) const
    -> Result<AggregationResult> {
  auto parsed = parse_strategy(strategy);
  if (!parsed) {
    return fail(parsed.error());
  }
  return ok(aggregate(items, *parsed, params));
}

auto Aggregator::concat(std::span<const JsonValue> items,
                        std::string_view separator) -> Outcome {
  std::string joined;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += project_text(items[i]);
  }
  log::debug("concat produced {} characters", joined.size());
  return JsonValue(std::move(joined));
}

auto Aggregator::stats(std::span<const JsonValue> items,
                       std::span<const std::string> fields) -> Outcome {
  if (fields.empty()) {
    return std::unexpected(
        Fault{.message = "No fields specified for stats aggregation"});
  }
  JsonValue per_field = make_object();
  for (const auto &field : fields) {
    per_field.get_object().insert_or_assign(field, field_stats(items, field));
  }
  JsonValue out{{"total_items", static_cast<std::int64_t>(items.size())}};
  out.get_object().emplace("fields", std::move(per_field));
  return out;
}

auto Aggregator::filter(std::span<const JsonValue> items,
                        const ItemPredicate &condition) -> Outcome {
  if (!condition) {
    log::warn("No condition given for filter aggregation, keeping all items");
    return make_array(std::vector<JsonValue>(items.begin(), items.end()));
  }
  std::vector<JsonValue> kept;
  for (const auto &item : items) {
    if (condition(item)) {
      kept.push_back(item);
    }
  }
  log::debug("filter kept {} of {} items", kept.size(), items.size());
  return make_array(std::move(kept));
}

auto Aggregator::custom(std::span<const JsonValue> items,
                        const std::optional<CodeSpec> &code) const -> Outcome {
  const bool blank =
      !code || (code->code && boost::algorithm::trim_copy(*code->code).empty()) ||
      (!code->code && !code->code_file);
  if (blank) {
    return std::unexpected(
        Fault{.message = "Custom aggregation code cannot be empty"});
  }

  JsonValue inputs{
      {"items", make_array(std::vector<JsonValue>(items.begin(), items.end()))}};
  log::info("Running custom {} aggregation (timeout {}s)",
            language_display_name(code->language), code->timeout.count());
  auto result = sandbox_->execute(*code, inputs);
  if (!result.success) {
    return std::unexpected(Fault{
        .message = std::format("Custom aggregation code execution failed: {}",
                               result.error.value_or("unknown error")),
        .stack_trace = std::move(result.stack_trace),
    });
  }
  log::info("Custom aggregation finished in {:.2f}s", result.execution_time);
  return std::move(result.output);
}

} // namespace evalflow
