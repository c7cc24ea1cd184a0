#include "evalflow/config/pipeline_definition.hpp"
#include "evalflow/config/toml_util.hpp"

#include "evalflow/batch/filter_condition.hpp"
#include "evalflow/sandbox/process_utils.hpp"
#include "evalflow/util/log.hpp"
#include "evalflow/util/string_hash.hpp"

#include <glaze/toml.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace evalflow {
namespace detail {

struct StepToml {
  std::string id;
  std::string type{"agent_flow"};
  std::string description;
  std::string output_key;
  std::map<std::string, std::string> input_mapping;

  std::string language{"python"};
  std::string code;
  std::string code_file;
  std::int64_t timeout{sandbox_defaults::kTimeout.count()};
  std::map<std::string, std::string> env;

  bool batch_mode{false};
  std::int64_t batch_size{batch_defaults::kBatchSize};
  bool concurrent{batch_defaults::kConcurrent};
  std::int64_t max_workers{
      static_cast<std::int64_t>(batch_defaults::kMaxWorkers)};
  std::string items_param{"items"};

  std::string aggregation_strategy{"concat"};
  std::string separator{"\n"};
  std::vector<std::string> fields;
  std::string condition;

  std::string agent;
  std::string flow;
  std::string model_override;
};

struct PipelineToml {
  std::string id;
  std::string name;
  std::string description;
  std::vector<StepToml> steps;
};

} // namespace detail
} // namespace evalflow

namespace glz {
template <> struct meta<evalflow::detail::StepToml> {
  using T = evalflow::detail::StepToml;
  static constexpr auto value = object(
      "id", &T::id, "type", &T::type, "description", &T::description,
      "output_key", &T::output_key, "input_mapping", &T::input_mapping,
      "language", &T::language, "code", &T::code, "code_file", &T::code_file,
      "timeout", &T::timeout, "env", &T::env, "batch_mode", &T::batch_mode,
      "batch_size", &T::batch_size, "concurrent", &T::concurrent,
      "max_workers", &T::max_workers, "items_param", &T::items_param,
      "aggregation_strategy", &T::aggregation_strategy, "separator",
      &T::separator, "fields", &T::fields, "condition", &T::condition, "agent",
      &T::agent, "flow", &T::flow, "model_override", &T::model_override);
};

template <> struct meta<evalflow::detail::PipelineToml> {
  using T = evalflow::detail::PipelineToml;
  static constexpr auto value =
      object("id", &T::id, "name", &T::name, "description", &T::description,
             "steps", &T::steps);
};
} // namespace glz

namespace evalflow {
namespace {

using Errors = std::vector<std::string>;

// Builds the CodeSpec for a code node or custom aggregation, reporting each
// problem separately rather than the builder's single error code.
[[nodiscard]] auto parse_code(const detail::StepToml &raw,
                              const std::filesystem::path &base_dir,
                              Errors &errors) -> std::optional<CodeSpec> {
  const auto before = errors.size();
  const bool has_code = !raw.code.empty();
  const bool has_file = !raw.code_file.empty();
  if (has_code && has_file) {
    errors.emplace_back(std::format(
        "Step '{}': set only one of 'code' and 'code_file'", raw.id));
  } else if (!has_code && !has_file) {
    errors.emplace_back(
        std::format("Step '{}': one of 'code' or 'code_file' is required",
                    raw.id));
  }
  if (raw.timeout <= 0) {
    errors.emplace_back(std::format(
        "Step '{}': timeout must be positive, got {}", raw.id, raw.timeout));
  }
  if (!parse_language(raw.language)) {
    errors.emplace_back(std::format(
        "Step '{}': unsupported language '{}'", raw.id, raw.language));
  }
  for (const auto &[key, value] : raw.env) {
    if (!is_valid_env_key(key)) {
      errors.emplace_back(std::format(
          "Step '{}': invalid environment variable name '{}'", raw.id, key));
    }
  }
  if (errors.size() != before) {
    return std::nullopt;
  }

  auto builder = CodeSpec::builder()
                     .language(std::string_view(raw.language))
                     .timeout(std::chrono::seconds(raw.timeout))
                     .env(EnvVars(raw.env.begin(), raw.env.end()));
  if (has_code) {
    std::move(builder).code(raw.code);
  } else {
    std::filesystem::path path(raw.code_file);
    if (path.is_relative() && !base_dir.empty()) {
      path = base_dir / path;
    }
    std::move(builder).code_file(std::move(path));
  }
  auto spec = std::move(builder).build();
  if (!spec) {
    errors.emplace_back(std::format("Step '{}': {}", raw.id,
                                    spec.error().message()));
    return std::nullopt;
  }
  return std::move(*spec);
}

[[nodiscard]] auto parse_aggregator(const detail::StepToml &raw,
                                    const std::filesystem::path &base_dir,
                                    Errors &errors)
    -> std::optional<BatchAggregatorStep> {
  auto strategy = parse_strategy(raw.aggregation_strategy);
  if (!strategy) {
    errors.emplace_back(std::format("Step '{}': unknown aggregation strategy "
                                    "'{}'",
                                    raw.id, raw.aggregation_strategy));
    return std::nullopt;
  }

  BatchAggregatorStep step{.strategy = *strategy};
  step.params.separator = raw.separator;
  step.params.fields = raw.fields;
  switch (*strategy) {
  case AggregationStrategy::Stats:
    if (raw.fields.empty()) {
      errors.emplace_back(std::format(
          "Step '{}': stats aggregation needs at least one field", raw.id));
      return std::nullopt;
    }
    break;
  case AggregationStrategy::Filter:
    if (!raw.condition.empty()) {
      auto condition = FilterCondition::parse(raw.condition);
      if (!condition) {
        errors.emplace_back(std::format(
            "Step '{}': invalid filter condition '{}'", raw.id,
            raw.condition));
        return std::nullopt;
      }
      step.params.condition = condition->predicate();
      step.condition_text = raw.condition;
    }
    break;
  case AggregationStrategy::Custom:
    if (raw.code.empty() && raw.code_file.empty()) {
      errors.emplace_back(std::format(
          "Step '{}': custom aggregation needs 'code' or 'code_file'",
          raw.id));
      return std::nullopt;
    }
    if (auto code = parse_code(raw, base_dir, errors)) {
      step.params.code = std::move(*code);
    } else {
      return std::nullopt;
    }
    break;
  case AggregationStrategy::Concat:
    break;
  }
  return step;
}

[[nodiscard]] auto parse_step(const detail::StepToml &raw,
                              const std::filesystem::path &base_dir,
                              Errors &errors) -> std::optional<StepConfig> {
  auto type = util::try_parse_enum<StepType>(raw.type);
  if (!type) {
    errors.emplace_back(
        std::format("Step '{}': unknown step type '{}'", raw.id, raw.type));
    return std::nullopt;
  }

  StepConfig step{.id = StepId(raw.id),
                  .output_key = raw.output_key,
                  .description = raw.description};
  for (const auto &[param, key] : raw.input_mapping) {
    step.input_mapping.push_back(
        InputBinding{.param = param, .context_key = key});
  }

  switch (*type) {
  case StepType::AgentFlow:
    step.kind = AgentFlowStep{
        .agent = raw.agent,
        .flow = raw.flow.empty() ? std::string("default") : raw.flow,
        .model_override = raw.model_override.empty()
                              ? std::nullopt
                              : std::optional<std::string>(raw.model_override),
    };
    break;
  case StepType::CodeNode: {
    auto code = parse_code(raw, base_dir, errors);
    if (!code) {
      return std::nullopt;
    }
    step.kind = CodeNodeStep{.code = std::move(*code)};
    break;
  }
  case StepType::BatchAggregator: {
    auto aggregator = parse_aggregator(raw, base_dir, errors);
    if (!aggregator) {
      return std::nullopt;
    }
    step.kind = std::move(*aggregator);
    break;
  }
  }

  if (raw.batch_mode) {
    if (raw.batch_size <= 0) {
      errors.emplace_back(std::format(
          "Step '{}': batch_size must be positive, got {}", raw.id,
          raw.batch_size));
    } else if (raw.batch_size > std::numeric_limits<int>::max()) {
      errors.emplace_back(std::format(
          "Step '{}': batch_size {} is too large", raw.id, raw.batch_size));
    }
    if (raw.max_workers <= 0) {
      errors.emplace_back(std::format(
          "Step '{}': max_workers must be positive, got {}", raw.id,
          raw.max_workers));
    }
    step.batch = BatchOptions{
        .batch_size = static_cast<int>(raw.batch_size),
        .concurrent = raw.concurrent,
        .max_workers = static_cast<std::size_t>(std::max<std::int64_t>(
            1, raw.max_workers)),
        .items_param = raw.items_param.empty() ? std::string("items")
                                               : raw.items_param,
    };
  }
  return step;
}

[[nodiscard]] auto join_errors(const Errors &errors) -> std::string {
  std::string joined;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      joined += "; ";
    }
    joined += errors[i];
  }
  return joined;
}

[[nodiscard]] auto parse_definition_from_text(
    std::string_view text, std::string *diagnostic,
    const std::filesystem::path &base_dir) -> Result<PipelineDefinition> {
  auto raw_result =
      toml_util::parse_toml<detail::PipelineToml>(text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  if (raw.id.empty()) {
    constexpr auto kErr =
        "Pipeline parse error: missing required top-level field 'id'\n"
        "Hint: add `id = \"your_pipeline_id\"` before any [[steps]] section.";
    log::error("{}", kErr);
    if (diagnostic) {
      *diagnostic = kErr;
    }
    return fail(Error::InvalidArgument);
  }

  PipelineDefinition def{.id = raw.id,
                         .name = raw.name.empty() ? raw.id : raw.name,
                         .description = raw.description};
  Errors errors;
  def.steps.reserve(raw.steps.size());
  for (const auto &step_raw : raw.steps) {
    if (auto step = parse_step(step_raw, base_dir, errors)) {
      def.steps.push_back(std::move(*step));
    }
  }

  // Cross-step checks only make sense once every step parsed.
  if (errors.empty()) {
    errors = validate_definition(def);
  }
  if (!errors.empty()) {
    for (const auto &err : errors) {
      log::error("Pipeline validation error: {}", err);
    }
    if (diagnostic) {
      *diagnostic = join_errors(errors);
    }
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(def));
}

} // namespace

auto validate_definition(const PipelineDefinition &def)
    -> std::vector<std::string> {
  Errors errors;
  if (def.steps.empty()) {
    errors.emplace_back("Pipeline must have at least one step");
    return errors;
  }

  StringMap<std::size_t> step_ids;
  StringMap<std::size_t> output_keys;
  for (std::size_t i = 0; i < def.steps.size(); ++i) {
    const auto &step = def.steps[i];
    if (step.id.empty()) {
      errors.emplace_back(std::format("Step #{}: id cannot be empty", i + 1));
    } else if (!step_ids.emplace(step.id.str(), i).second) {
      errors.emplace_back(std::format("Duplicate step ID: '{}'", step.id));
    }

    if (step.output_key.empty()) {
      errors.emplace_back(
          std::format("Step '{}': output_key cannot be empty", step.id));
    } else if (!output_keys.emplace(step.output_key, i).second) {
      errors.emplace_back(std::format(
          "Step '{}': output_key '{}' is already written by an earlier step",
          step.id, step.output_key));
    }

    if (const auto *agent = std::get_if<AgentFlowStep>(&step.kind)) {
      if (agent->agent.empty()) {
        errors.emplace_back(
            std::format("Step '{}': agent flow step needs 'agent'", step.id));
      }
    }
    if (step.batch && step.batch->items_param.empty()) {
      errors.emplace_back(
          std::format("Step '{}': items_param cannot be empty", step.id));
    }
  }
  return errors;
}

auto PipelineDefinitionLoader::load_from_file(std::string_view path,
                                              std::string *diagnostic)
    -> Result<PipelineDefinition> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = text.error().message();
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic,
                          std::filesystem::path(path).parent_path());
}

auto PipelineDefinitionLoader::load_from_string(
    std::string_view toml_str, std::string *diagnostic,
    const std::filesystem::path &base_dir) -> Result<PipelineDefinition> {
  try {
    return parse_definition_from_text(toml_str, diagnostic, base_dir);
  } catch (const std::exception &e) {
    log::error("Pipeline TOML parse error: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace evalflow
