#include "evalflow/config/config.hpp"
#include "evalflow/config/toml_util.hpp"

#include "evalflow/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

namespace evalflow {
namespace detail {

struct SandboxToml {
  std::string python_executable;
  std::string node_executable;
  std::int64_t default_timeout_sec{sandbox_defaults::kTimeout.count()};
  std::int64_t kill_grace_ms{sandbox_defaults::kKillGrace.count()};
  std::string temp_dir;
};

struct SchedulerToml {
  std::int64_t max_workers{
      static_cast<std::int64_t>(scheduler_defaults::kMaxWorkers)};
  std::string log_level{"info"};
  std::string log_file;
};

struct BatchToml {
  std::int64_t batch_size{batch_defaults::kBatchSize};
  bool concurrent{batch_defaults::kConcurrent};
  std::int64_t max_workers{
      static_cast<std::int64_t>(batch_defaults::kMaxWorkers)};
};

struct EngineToml {
  SandboxToml sandbox{};
  SchedulerToml scheduler{};
  BatchToml batch{};
};

} // namespace detail
} // namespace evalflow

namespace glz {
template <> struct meta<evalflow::detail::SandboxToml> {
  using T = evalflow::detail::SandboxToml;
  static constexpr auto value = object(
      "python_executable", &T::python_executable, "node_executable",
      &T::node_executable, "default_timeout_sec", &T::default_timeout_sec,
      "kill_grace_ms", &T::kill_grace_ms, "temp_dir", &T::temp_dir);
};

template <> struct meta<evalflow::detail::SchedulerToml> {
  using T = evalflow::detail::SchedulerToml;
  static constexpr auto value =
      object("max_workers", &T::max_workers, "log_level", &T::log_level,
             "log_file", &T::log_file);
};

template <> struct meta<evalflow::detail::BatchToml> {
  using T = evalflow::detail::BatchToml;
  static constexpr auto value =
      object("batch_size", &T::batch_size, "concurrent", &T::concurrent,
             "max_workers", &T::max_workers);
};

template <> struct meta<evalflow::detail::EngineToml> {
  using T = evalflow::detail::EngineToml;
  static constexpr auto value = object("sandbox", &T::sandbox, "scheduler",
                                       &T::scheduler, "batch", &T::batch);
};
} // namespace glz

namespace evalflow {
namespace {

auto apply_env_overrides(detail::EngineToml &raw) -> void {
  if (const char *v = std::getenv("EVALFLOW_PYTHON"); v != nullptr) {
    raw.sandbox.python_executable = v;
  }
  if (const char *v = std::getenv("EVALFLOW_NODE"); v != nullptr) {
    raw.sandbox.node_executable = v;
  }
  if (const char *v = std::getenv("EVALFLOW_SANDBOX_TIMEOUT_SEC");
      v != nullptr) {
    raw.sandbox.default_timeout_sec = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("EVALFLOW_MAX_WORKERS"); v != nullptr) {
    raw.scheduler.max_workers = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("EVALFLOW_LOG_LEVEL"); v != nullptr) {
    raw.scheduler.log_level = v;
  }
  if (const char *v = std::getenv("EVALFLOW_BATCH_SIZE"); v != nullptr) {
    raw.batch.batch_size = boost::lexical_cast<std::int64_t>(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<EngineConfig> {
  auto raw_result = toml_util::parse_toml<detail::EngineToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  if (raw.sandbox.default_timeout_sec <= 0 || raw.sandbox.kill_grace_ms < 0 ||
      raw.scheduler.max_workers <= 0 || raw.batch.batch_size <= 0 ||
      raw.batch.max_workers <= 0) {
    log::error("Engine config holds a non-positive timeout, worker count or "
               "batch size");
    return fail(Error::ParseError);
  }
  if (raw.batch.batch_size > std::numeric_limits<int>::max()) {
    log::error("Engine config batch size {} is too large",
               raw.batch.batch_size);
    return fail(Error::ParseError);
  }
  if (!log::parse_level(raw.scheduler.log_level)) {
    log::error("Unknown log level '{}'", raw.scheduler.log_level);
    return fail(Error::ParseError);
  }

  EngineConfig cfg{};
  cfg.sandbox.python_executable = std::move(raw.sandbox.python_executable);
  cfg.sandbox.node_executable = std::move(raw.sandbox.node_executable);
  cfg.sandbox.default_timeout =
      std::chrono::seconds(raw.sandbox.default_timeout_sec);
  cfg.sandbox.kill_grace = std::chrono::milliseconds(raw.sandbox.kill_grace_ms);
  cfg.sandbox.temp_dir = std::move(raw.sandbox.temp_dir);

  cfg.scheduler.max_workers =
      static_cast<std::size_t>(raw.scheduler.max_workers);
  cfg.scheduler.log_level = std::move(raw.scheduler.log_level);
  cfg.scheduler.log_file = std::move(raw.scheduler.log_file);

  cfg.batch.batch_size = static_cast<int>(raw.batch.batch_size);
  cfg.batch.concurrent = raw.batch.concurrent;
  cfg.batch.max_workers = static_cast<std::size_t>(raw.batch.max_workers);
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric value in EVALFLOW_* environment: {}",
               e.what());
    return fail(Error::ParseError);
  }
}

} // namespace evalflow
