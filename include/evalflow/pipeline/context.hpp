#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/util/json.hpp"
#include "evalflow/util/string_hash.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace evalflow {

/// Key-value store threaded through one pipeline run for one sample. Keys are
/// write-once. Not thread-safe: a context belongs to the run driving it.
class PipelineContext {
public:
  PipelineContext() = default;

  /// Seeds the context from the members of `inputs` (must be an object or
  /// null).
  [[nodiscard]] static auto from_inputs(const JsonValue &inputs)
      -> Result<PipelineContext>;

  /// Fails with Error::ContextKeyExists if `key` is already present.
  [[nodiscard]] auto set(std::string key, JsonValue value) -> Result<void>;

  [[nodiscard]] auto get(std::string_view key) const -> const JsonValue *;

  [[nodiscard]] auto contains(std::string_view key) const -> bool {
    return values_.contains(key);
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

  /// Every key and value as a JSON object.
  [[nodiscard]] auto snapshot() const -> JsonValue;

private:
  StringMap<JsonValue> values_;
};

} // namespace evalflow
