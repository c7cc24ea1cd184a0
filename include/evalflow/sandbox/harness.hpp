#pragma once

#include "evalflow/sandbox/code_spec.hpp"
#include "evalflow/util/json.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace evalflow {

enum class EntryArgument : std::uint8_t {
  Inputs,        // f(inputs)
  ItemsOrInputs, // f(inputs.items) when present, else f(inputs)
};

struct EntryPoint {
  std::string_view name;
  EntryArgument argument;
  bool module_export{false}; // JS default export: module.exports[.default]
};

// Probed in order; the first callable wins. No match echoes inputs back.
inline constexpr std::array kPythonEntryPoints = {
    EntryPoint{"aggregate", EntryArgument::ItemsOrInputs},
    EntryPoint{"transform", EntryArgument::Inputs},
    EntryPoint{"process_data", EntryArgument::Inputs},
    EntryPoint{"process", EntryArgument::Inputs},
    EntryPoint{"main", EntryArgument::Inputs},
};

inline constexpr std::array kJavascriptEntryPoints = {
    EntryPoint{"aggregate", EntryArgument::ItemsOrInputs},
    EntryPoint{"transform", EntryArgument::Inputs},
    EntryPoint{"process_data", EntryArgument::Inputs},
    EntryPoint{"process", EntryArgument::Inputs},
    EntryPoint{"main", EntryArgument::Inputs},
    EntryPoint{"module.exports", EntryArgument::Inputs, true},
};

[[nodiscard]] auto entry_points(Language language) noexcept
    -> std::span<const EntryPoint>;

/// Full program text: binds `inputs`, embeds `code` verbatim, calls the
/// first entry point found and prints its result as one JSON line.
[[nodiscard]] auto generate_harness(Language language, std::string_view code,
                                    const JsonValue &inputs) -> std::string;

} // namespace evalflow
