#include "evalflow/pipeline/context.hpp"

#include "evalflow/util/log.hpp"

#include <utility>

namespace evalflow {

auto PipelineContext::from_inputs(const JsonValue &inputs)
    -> Result<PipelineContext> {
  PipelineContext ctx;
  if (inputs.is_null()) {
    return ok(std::move(ctx));
  }
  if (!inputs.is_object()) {
    log::error("Sample inputs must be a JSON object");
    return fail(Error::InvalidArgument);
  }
  for (const auto &[key, value] : inputs.get_object()) {
    if (auto r = ctx.set(key, value); !r) {
      return fail(r.error());
    }
  }
  return ok(std::move(ctx));
}

auto PipelineContext::set(std::string key, JsonValue value) -> Result<void> {
  if (values_.contains(key)) {
    log::error("context key '{}' already set", key);
    return fail(Error::ContextKeyExists);
  }
  values_.emplace(std::move(key), std::move(value));
  return ok();
}

auto PipelineContext::get(std::string_view key) const -> const JsonValue * {
  auto it = values_.find(key);
  return it == values_.end() ? nullptr : &it->second;
}

auto PipelineContext::snapshot() const -> JsonValue {
  JsonValue out = make_object();
  auto &obj = out.get_object();
  for (const auto &[key, value] : values_) {
    obj.insert_or_assign(key, value);
  }
  return out;
}

} // namespace evalflow
