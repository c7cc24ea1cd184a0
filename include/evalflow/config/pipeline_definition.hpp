#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/pipeline/step.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace evalflow {

/// Reads pipeline definitions from TOML: top-level `id`, `name`,
/// `description` and one `[[steps]]` table per step. Every validation
/// problem is collected into `diagnostic` ("; "-joined) and the load fails
/// with Error::InvalidArgument.
class PipelineDefinitionLoader {
public:
  /// Relative `code_file` paths resolve against the file's directory.
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<PipelineDefinition>;

  /// Relative `code_file` paths resolve against `base_dir` when it is set.
  [[nodiscard]] static auto
  load_from_string(std::string_view toml_str, std::string *diagnostic = nullptr,
                   const std::filesystem::path &base_dir = {})
      -> Result<PipelineDefinition>;
};

/// Cross-step checks for a definition built in code: step ids and output keys
/// must be non-empty and unique, agent flow steps need an agent.
[[nodiscard]] auto validate_definition(const PipelineDefinition &def)
    -> std::vector<std::string>;

} // namespace evalflow
