#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace evalflow {

struct TokenUsage {
  std::int64_t input_tokens{0};
  std::int64_t output_tokens{0};
  std::int64_t total_tokens{0};

  auto operator+=(const TokenUsage &other) noexcept -> TokenUsage & {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    total_tokens += other.total_tokens;
    return *this;
  }

  auto operator==(const TokenUsage &) const -> bool = default;
};

struct AgentRequest {
  std::string agent;
  std::string flow;
  JsonValue inputs{};
  std::optional<std::string> model_override;
};

struct AgentResponse {
  JsonValue output{};
  TokenUsage usage;
};

/// Calls an agent flow. Implementations live outside the engine; an error
/// return fails the step.
class AgentInvoker {
public:
  virtual ~AgentInvoker() = default;

  [[nodiscard]] virtual auto invoke(const AgentRequest &request)
      -> Result<AgentResponse> = 0;
};

} // namespace evalflow
