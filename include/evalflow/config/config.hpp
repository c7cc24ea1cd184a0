#pragma once

#include "evalflow/config/engine_config.hpp"
#include "evalflow/core/error.hpp"

#include <string_view>

namespace evalflow {

/// Engine settings from TOML. EVALFLOW_* environment variables override the
/// file; out-of-range or unparsable values fail with Error::ParseError.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<EngineConfig>;
};

} // namespace evalflow
