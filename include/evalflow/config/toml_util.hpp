#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/util/log.hpp"

#include <glaze/toml.hpp>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace evalflow::toml_util {

/// Whole file as a string. FileNotFound or PermissionDenied on failure.
[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  errno = 0;
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    const bool denied = errno == EACCES;
    log::error("Cannot read {}", path);
    return fail(denied ? Error::PermissionDenied : Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// TOML text into a glaze-described struct. Unknown keys are ignored; blank
/// text yields a default-constructed T.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    return ok(std::move(raw));
  }
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace evalflow::toml_util
