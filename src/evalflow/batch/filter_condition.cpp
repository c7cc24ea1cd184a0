#include "evalflow/batch/filter_condition.hpp"

#include "evalflow/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <utility>

namespace evalflow {

namespace {

struct OpToken {
  std::string_view symbol;
  CompareOp op;
};

constexpr std::array<OpToken, 7> kOps{{
    {"==", CompareOp::Equal},
    {"!=", CompareOp::NotEqual},
    {">=", CompareOp::GreaterEqual},
    {"<=", CompareOp::LessEqual},
    {">", CompareOp::Greater},
    {"<", CompareOp::Less},
    {"contains", CompareOp::Contains},
}};

[[nodiscard]] auto is_space(char c) noexcept -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Splits off the leading whitespace-delimited token.
[[nodiscard]] auto next_token(std::string_view &rest) -> std::string_view {
  while (!rest.empty() && is_space(rest.front())) {
    rest.remove_prefix(1);
  }
  std::size_t end = 0;
  while (end < rest.size() && !is_space(rest[end])) {
    ++end;
  }
  auto token = rest.substr(0, end);
  rest.remove_prefix(end);
  return token;
}

[[nodiscard]] auto json_equal(const JsonValue &lhs, const JsonValue &rhs)
    -> bool {
  auto l = as_number(lhs);
  auto r = as_number(rhs);
  if (l && r) {
    return *l == *r;
  }
  return dump_json(lhs) == dump_json(rhs);
}

// -1/0/1, or nullopt when the two values have no natural order.
[[nodiscard]] auto json_compare(const JsonValue &lhs, const JsonValue &rhs)
    -> std::optional<int> {
  if (auto l = as_number(lhs), r = as_number(rhs); l && r) {
    return *l < *r ? -1 : (*l > *r ? 1 : 0);
  }
  const auto *ls = lhs.get_if<std::string>();
  const auto *rs = rhs.get_if<std::string>();
  if (ls && rs) {
    auto cmp = ls->compare(*rs);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
  }
  return std::nullopt;
}

[[nodiscard]] auto json_contains(const JsonValue &haystack,
                                 const JsonValue &needle) -> bool {
  if (const auto *text = haystack.get_if<std::string>()) {
    return text->find(stringify(needle)) != std::string::npos;
  }
  if (const auto *arr = haystack.get_if<JsonArray>()) {
    return std::ranges::any_of(
        *arr, [&](const JsonValue &v) { return json_equal(v, needle); });
  }
  if (haystack.is_object()) {
    if (const auto *key = needle.get_if<std::string>()) {
      return find_member(haystack, *key) != nullptr;
    }
  }
  return false;
}

} // namespace

auto compare_op_symbol(CompareOp op) noexcept -> std::string_view {
  for (const auto &token : kOps) {
    if (token.op == op) {
      return token.symbol;
    }
  }
  return "?";
}

auto FilterCondition::parse(std::string_view expression)
    -> Result<FilterCondition> {
  std::string_view rest = expression;
  auto field = next_token(rest);
  auto op_text = next_token(rest);
  auto literal_text = boost::algorithm::trim_copy(std::string(rest));

  if (field.empty() || op_text.empty() || literal_text.empty()) {
    log::error("Invalid filter condition '{}': expected '<field> <op> <value>'",
               expression);
    return fail(Error::InvalidArgument);
  }

  const auto *op = std::ranges::find(kOps, op_text, &OpToken::symbol);
  if (op == kOps.end()) {
    log::error("Invalid filter condition '{}': unknown operator '{}'",
               expression, op_text);
    return fail(Error::InvalidArgument);
  }

  FilterCondition condition;
  condition.field_ = std::string(field);
  condition.op_ = op->op;
  if (auto parsed = parse_json(literal_text)) {
    condition.literal_ = std::move(*parsed);
  } else {
    condition.literal_ = JsonValue(literal_text);
  }
  return ok(std::move(condition));
}

auto FilterCondition::matches(const JsonValue &item) const -> bool {
  const auto *value = find_member(item, field_);
  if (value == nullptr) {
    return false;
  }
  switch (op_) {
  case CompareOp::Equal:
    return json_equal(*value, literal_);
  case CompareOp::NotEqual:
    return !json_equal(*value, literal_);
  case CompareOp::Contains:
    return json_contains(*value, literal_);
  case CompareOp::Greater:
  case CompareOp::GreaterEqual:
  case CompareOp::Less:
  case CompareOp::LessEqual:
    break;
  }

  auto cmp = json_compare(*value, literal_);
  if (!cmp) {
    return false;
  }
  switch (op_) {
  case CompareOp::Greater:
    return *cmp > 0;
  case CompareOp::GreaterEqual:
    return *cmp >= 0;
  case CompareOp::Less:
    return *cmp < 0;
  case CompareOp::LessEqual:
    return *cmp <= 0;
  default:
    return false;
  }
}

auto FilterCondition::to_string() const -> std::string {
  return std::format("{} {} {}", field_, compare_op_symbol(op_),
                     dump_json(literal_));
}

} // namespace evalflow
