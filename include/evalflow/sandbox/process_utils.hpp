#pragma once

#include "evalflow/sandbox/code_spec.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace evalflow {

/// Truncate code for log preview (max 80 chars, first line only).
[[nodiscard]] inline auto code_preview(std::string_view code) -> std::string {
  auto first_line = code.substr(0, code.find('\n'));
  if (first_line.size() <= 80 && first_line.size() == code.size()) {
    return std::string(first_line);
  }
  return std::string(first_line.substr(0, 80)) + "...";
}

/// Validate an environment variable key (POSIX: [A-Za-z_][A-Za-z0-9_]*).
[[nodiscard]] inline auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_')
    return false;
  return std::ranges::all_of(key, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
  });
}

[[nodiscard]] inline auto last_non_empty_line(std::string_view text)
    -> std::string {
  while (!text.empty()) {
    const auto pos = text.rfind('\n');
    const auto start = pos == std::string_view::npos ? 0 : pos + 1;
    auto trimmed = boost::algorithm::trim_copy(std::string(text.substr(start)));
    if (!trimmed.empty()) {
      return trimmed;
    }
    if (pos == std::string_view::npos) {
      break;
    }
    text = text.substr(0, pos);
  }
  return {};
}

/// Stderr markers that identify an interpreter-produced traceback.
[[nodiscard]] inline auto stack_trace_markers(Language language)
    -> std::span<const std::string_view> {
  static constexpr std::array<std::string_view, 1> kPython = {"Traceback"};
  static constexpr std::array<std::string_view, 2> kJavascript = {"Error:",
                                                                   "    at "};
  if (language == Language::Javascript) {
    return kJavascript;
  }
  return kPython;
}

/// Stack trace from stderr: everything from the line holding the first
/// recognizable marker onward, or raw stderr when no marker is present.
[[nodiscard]] inline auto extract_stack_trace(Language language,
                                              std::string_view stderr_text)
    -> std::optional<std::string> {
  if (boost::algorithm::trim_copy(std::string(stderr_text)).empty()) {
    return std::nullopt;
  }
  auto first = std::string_view::npos;
  for (auto marker : stack_trace_markers(language)) {
    first = std::min(first, stderr_text.find(marker));
  }
  if (first == std::string_view::npos) {
    return std::string(stderr_text);
  }
  const auto line_start = stderr_text.rfind('\n', first);
  return std::string(stderr_text.substr(
      line_start == std::string_view::npos ? 0 : line_start + 1));
}

} // namespace evalflow
