#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace evalflow {

enum class Error : std::uint8_t {
  Success,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  CycleDetected,
  ParseError,
  FileNotFound,
  PermissionDenied,
  InvalidBatchSize,
  UnknownStrategy,
  InvalidCodeSpec,
  ContextKeyExists,
  InterpreterNotFound,
  SpawnFailed,
  Timeout,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 16> messages = {
      "success",
      "invalid argument",
      "not found",
      "already exists",
      "cycle detected in dependency graph",
      "parse error",
      "file not found",
      "permission denied",
      "batch size must be a positive integer",
      "unknown aggregation strategy",
      "code spec needs exactly one of inline code or code file",
      "context key already set",
      "interpreter not found in PATH",
      "failed to spawn process",
      "timeout",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "evalflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// True for codes that mean the caller handed us something malformed, as
/// opposed to a runtime condition captured into a result value.
[[nodiscard]] inline auto is_configuration_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::InvalidArgument:
  case Error::AlreadyExists:
  case Error::NotFound:
  case Error::CycleDetected:
  case Error::InvalidBatchSize:
  case Error::UnknownStrategy:
  case Error::InvalidCodeSpec:
    return true;
  default:
    return false;
  }
}

} // namespace evalflow

template <> struct std::is_error_code_enum<evalflow::Error> : std::true_type {};
