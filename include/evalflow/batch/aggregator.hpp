#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/sandbox/code_spec.hpp"
#include "evalflow/sandbox/sandbox.hpp"
#include "evalflow/util/enum.hpp"
#include "evalflow/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace evalflow {

enum class AggregationStrategy : std::uint8_t {
  Concat,
  Stats,
  Filter,
  Custom,
};
BOOST_DESCRIBE_ENUM(AggregationStrategy, Concat, Stats, Filter, Custom)
EVALFLOW_DEFINE_ENUM_SERDE(AggregationStrategy, AggregationStrategy::Concat)

/// Strict parse: unknown names fail with Error::UnknownStrategy.
[[nodiscard]] auto parse_strategy(std::string_view name)
    -> Result<AggregationStrategy>;

using ItemPredicate = std::function<bool(const JsonValue &)>;

struct AggregationParams {
  std::string separator{"\n"};
  std::vector<std::string> fields;
  // Empty keeps every item.
  ItemPredicate condition;
  std::optional<CodeSpec> code;
};

struct AggregationResult {
  bool success{false};
  JsonValue result{};
  std::optional<std::string> error;
  AggregationStrategy strategy{AggregationStrategy::Concat};
  std::size_t item_count{0};
  std::optional<std::string> stack_trace;
};

[[nodiscard]] auto to_json(const AggregationResult &result) -> JsonValue;

/// Reduces a list of items to one value. Strategy faults, including those
/// raised by a caller's predicate or custom code, come back as
/// success=false; aggregate() itself never throws for them.
class Aggregator {
public:
  /// The custom strategy runs through `sandbox`; a default one is created
  /// when none is given.
  explicit Aggregator(std::shared_ptr<const CodeSandbox> sandbox = nullptr);

  [[nodiscard]] auto aggregate(std::span<const JsonValue> items,
                               AggregationStrategy strategy,
                               const AggregationParams &params = {}) const
      -> AggregationResult;

  [[nodiscard]] auto aggregate(std::span<const JsonValue> items,
                               std::string_view strategy,
                               const AggregationParams &params = {}) const
      -> Result<AggregationResult>;

private:
  struct Fault {
    std::string message;
    std::optional<std::string> stack_trace;
  };
  using Outcome = std::expected<JsonValue, Fault>;

  [[nodiscard]] static auto concat(std::span<const JsonValue> items,
                                   std::string_view separator) -> Outcome;
  [[nodiscard]] static auto stats(std::span<const JsonValue> items,
                                  std::span<const std::string> fields)
      -> Outcome;
  [[nodiscard]] static auto filter(std::span<const JsonValue> items,
                                   const ItemPredicate &condition) -> Outcome;
  [[nodiscard]] auto custom(std::span<const JsonValue> items,
                            const std::optional<CodeSpec> &code) const
      -> Outcome;

  std::shared_ptr<const CodeSandbox> sandbox_;
};

} // namespace evalflow
