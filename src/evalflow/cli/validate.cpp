#include "evalflow/cli/commands.hpp"
#include "evalflow/cli/formatting.hpp"
#include "evalflow/config/pipeline_definition.hpp"
#include "evalflow/util/json.hpp"
#include "evalflow/util/log.hpp"

#include <filesystem>
#include <print>
#include <vector>

namespace evalflow::cli {

namespace {

struct ValidationResult {
  std::string pipeline_id;
  std::string file_path;
  bool valid{false};
  std::size_t step_count{0};
  std::string error;
};

auto validate_single_file(const std::filesystem::path &path)
    -> ValidationResult {
  ValidationResult vr{.pipeline_id = path.stem().string(),
                      .file_path = path.string()};
  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_file(path.string(),
                                                      &diagnostic);
  vr.valid = def.has_value();
  if (vr.valid) {
    vr.pipeline_id = def->id;
    vr.step_count = def->steps.size();
  } else {
    vr.error = diagnostic.empty() ? def.error().message() : diagnostic;
  }
  return vr;
}

// Expands directories to the .toml files directly inside them.
auto collect_files(const std::vector<std::string> &inputs)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> files;
  for (const auto &input : inputs) {
    std::filesystem::path path(input);
    if (!std::filesystem::is_directory(path)) {
      files.push_back(path);
      continue;
    }
    for (const auto &entry : std::filesystem::directory_iterator(path)) {
      if (entry.is_regular_file() && entry.path().extension() == ".toml") {
        files.push_back(entry.path());
      }
    }
  }
  return files;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  if (!load_engine_config(opts.global)) {
    return 1;
  }

  std::vector<ValidationResult> results;
  for (const auto &path : collect_files(opts.files)) {
    if (!std::filesystem::exists(path)) {
      std::println(stderr, "Error: File does not exist: {}", path.string());
      return 1;
    }
    results.emplace_back(validate_single_file(path));
  }

  std::size_t invalid_count = 0;
  for (const auto &vr : results) {
    if (!vr.valid) {
      ++invalid_count;
    }
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"pipeline_id", vr.pipeline_id},
          {"file", vr.file_path},
          {"valid", vr.valid},
          {"steps", static_cast<std::int64_t>(vr.step_count)},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid",
              static_cast<std::int64_t>(results.size() - invalid_count)},
             {"invalid", static_cast<std::int64_t>(invalid_count)},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} ({} steps) {}", fmt::ansi::green("valid"),
                     vr.pipeline_id, vr.step_count,
                     fmt::ansi::dim(vr.file_path));
      } else {
        std::println("{} {}", fmt::ansi::red("invalid"), vr.file_path);
        fmt::print_indented(stdout, vr.error);
      }
    }
    if (results.size() > 1) {
      std::println("\n{} valid, {} invalid",
                   results.size() - invalid_count, invalid_count);
    }
  }
  return invalid_count == 0 ? 0 : 1;
}

} // namespace evalflow::cli
