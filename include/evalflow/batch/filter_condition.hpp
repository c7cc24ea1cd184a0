#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/util/json.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace evalflow {

enum class CompareOp : std::uint8_t {
  Equal,
  NotEqual,
  Greater,
  GreaterEqual,
  Less,
  LessEqual,
  Contains,
};

[[nodiscard]] auto compare_op_symbol(CompareOp op) noexcept -> std::string_view;

/// `<field> <op> <literal>`, e.g. `score >= 80` or `label == "spam"`.
/// The literal is read as JSON; anything that is not valid JSON is taken as a
/// bare string. An item without the field never matches.
class FilterCondition {
public:
  [[nodiscard]] static auto parse(std::string_view expression)
      -> Result<FilterCondition>;

  [[nodiscard]] auto matches(const JsonValue &item) const -> bool;

  [[nodiscard]] auto predicate() const
      -> std::function<bool(const JsonValue &)> {
    return [condition = *this](const JsonValue &item) {
      return condition.matches(item);
    };
  }

  [[nodiscard]] auto field() const noexcept -> const std::string & {
    return field_;
  }
  [[nodiscard]] auto op() const noexcept -> CompareOp { return op_; }
  [[nodiscard]] auto literal() const noexcept -> const JsonValue & {
    return literal_;
  }

  [[nodiscard]] auto to_string() const -> std::string;

private:
  std::string field_;
  CompareOp op_{CompareOp::Equal};
  JsonValue literal_{};
};

} // namespace evalflow
