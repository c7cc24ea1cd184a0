#include "evalflow/cli/commands.hpp"
#include "evalflow/config/config.hpp"
#include "evalflow/util/log.hpp"

#include <print>

namespace evalflow::cli {

auto load_engine_config(const GlobalOptions &opts) -> Result<EngineConfig> {
  auto config = opts.config_file.empty()
                    ? ConfigLoader::load_from_string("")
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: cannot load config{}{}: {}",
                 opts.config_file.empty() ? "" : " ", opts.config_file,
                 config.error().message());
    return config;
  }

  const auto &level = opts.log_level ? *opts.log_level
                                     : config->scheduler.log_level;
  if (!log::parse_level(level)) {
    std::println(stderr, "Error: unknown log level '{}'", level);
    return fail(Error::InvalidArgument);
  }
  log::set_level(level);
  if (!config->scheduler.log_file.empty() &&
      !log::set_output_file(config->scheduler.log_file)) {
    std::println(stderr, "Warning: cannot open log file {}, logging to stderr",
                 config->scheduler.log_file);
  }
  return config;
}

} // namespace evalflow::cli
