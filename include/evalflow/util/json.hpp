#pragma once

#include "evalflow/core/error.hpp"

#include <glaze/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evalflow {

using JsonValue = glz::generic_json<glz::num_mode::i64>;
using JsonArray = JsonValue::array_t;
using JsonObject = JsonValue::object_t;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

/// Whole-input parse: anything after the first value is an error.
[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false,
                                   .validate_trailing_whitespace = true};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto make_object() -> JsonValue {
  JsonValue value = JsonObject{};
  return value;
}

[[nodiscard]] inline auto make_array(std::vector<JsonValue> items = {})
    -> JsonValue {
  JsonValue value = JsonArray(std::make_move_iterator(items.begin()),
                              std::make_move_iterator(items.end()));
  return value;
}

/// Integral doubles come back as JSON integers so `253` does not print as
/// `253.0`.
[[nodiscard]] inline auto make_number(double v) -> JsonValue {
  if (std::isfinite(v) && std::floor(v) == v &&
      std::abs(v) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return JsonValue(static_cast<std::int64_t>(v));
  }
  return JsonValue(v);
}

/// Numeric value of `value` if it is a JSON number. Booleans are not numbers.
[[nodiscard]] inline auto as_number(const JsonValue &value)
    -> std::optional<double> {
  if (const auto *i = value.get_if<std::int64_t>()) {
    return static_cast<double>(*i);
  }
  if (const auto *d = value.get_if<double>()) {
    return *d;
  }
  return std::nullopt;
}

[[nodiscard]] inline auto find_member(const JsonValue &value,
                                      std::string_view key)
    -> const JsonValue * {
  if (!value.is_object()) {
    return nullptr;
  }
  const auto &obj = value.get_object();
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

/// Text form used when a value is spliced into a string: strings verbatim,
/// everything else as compact JSON.
[[nodiscard]] inline auto stringify(const JsonValue &value) -> std::string {
  if (const auto *text = value.get_if<std::string>()) {
    return *text;
  }
  return dump_json(value);
}

} // namespace evalflow
