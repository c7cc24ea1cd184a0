#include "evalflow/sandbox/sandbox.hpp"

#include "evalflow/core/coroutine.hpp"
#include "evalflow/sandbox/harness.hpp"
#include "evalflow/sandbox/process_utils.hpp"
#include "evalflow/util/log.hpp"
#include "evalflow/util/time.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace evalflow {

namespace {

namespace bp = boost::process::v2;
namespace fs = std::filesystem;

template <typename Map>
[[nodiscard]] auto build_process_env(const Map &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string_view(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }

  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }

  return bp::process_environment(std::move(env_vec));
}

// Child side of the spawn: become leader of a fresh process group so the
// whole tree can be signalled with killpg().
struct ProcessGroupLeader {
  template <typename Launcher, typename Path>
  auto on_exec_setup(Launcher &, const Path &, const char *const *&)
      -> boost::system::error_code {
    if (::setpgid(0, 0) != 0) {
      return {errno, boost::system::system_category()};
    }
    return {};
  }
};

auto signal_group(pid_t pgid, int sig) -> void {
  if (pgid <= 0) {
    return;
  }
  if (::killpg(pgid, sig) != 0 && errno != ESRCH) {
    log::warn("killpg({}, {}) failed: {}", pgid, sig, std::strerror(errno));
  }
}

// Kills whatever is left of the process group when the call unwinds,
// including on exceptions.
class ProcessGroupGuard {
public:
  explicit ProcessGroupGuard(pid_t pgid) : pgid_(pgid) {}
  ~ProcessGroupGuard() { signal_group(pgid_, SIGKILL); }

  ProcessGroupGuard(const ProcessGroupGuard &) = delete;
  ProcessGroupGuard &operator=(const ProcessGroupGuard &) = delete;

private:
  pid_t pgid_;
};

// Generated program file, removed on destruction.
class TempFile {
public:
  TempFile(TempFile &&other) noexcept : path_(std::exchange(other.path_, {})) {}
  TempFile &operator=(TempFile &&) = delete;
  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  ~TempFile() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    if (!fs::remove(path_, ec) && ec) {
      log::warn("Failed to remove temp file {}: {}", path_.string(),
                ec.message());
    }
  }

  [[nodiscard]] static auto create(const fs::path &dir,
                                   std::string_view extension,
                                   std::string_view content)
      -> Result<TempFile> {
    std::string pattern =
        (dir / std::format("evalflow_XXXXXX{}", extension)).string();
    const int fd = ::mkstemps(pattern.data(), static_cast<int>(extension.size()));
    if (fd < 0) {
      return fail(std::error_code(errno, std::system_category()));
    }
    TempFile file{fs::path(pattern)};
    std::size_t written = 0;
    while (written < content.size()) {
      const auto n =
          ::write(fd, content.data() + written, content.size() - written);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        const auto ec = std::error_code(errno, std::system_category());
        ::close(fd);
        return fail(ec);
      }
      written += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
      return fail(std::error_code(errno, std::system_category()));
    }
    return ok(std::move(file));
  }

  [[nodiscard]] auto path() const noexcept -> const fs::path & {
    return path_;
  }

private:
  explicit TempFile(fs::path path) : path_(std::move(path)) {}

  fs::path path_;
};

struct WaitOutcome {
  int exit_code{-1};
  bool timed_out{false};
};

struct PipeCapture {
  boost::asio::readable_pipe pipe;
  boost::asio::cancellation_signal cancel;
  std::string text;

  explicit PipeCapture(boost::asio::io_context &io) : pipe(io) {
    text.reserve(io::kInitialOutputReserve);
  }
};

[[nodiscard]] auto read_pipe_all(PipeCapture &capture) -> task<void> {
  std::array<char, io::kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await capture.pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(capture.cancel.slot(),
                                            use_nothrow));
    if (bytes > 0 && capture.text.size() < io::kMaxOutputSize) {
      const auto remaining = io::kMaxOutputSize - capture.text.size();
      capture.text.append(buffer.data(), std::min(remaining, bytes));
    }
    if (ec) {
      co_return;
    }
  }
}

struct SuperviseParams {
  pid_t pgid{-1};
  std::chrono::seconds timeout;
  std::chrono::milliseconds kill_grace;
  std::chrono::milliseconds pipe_drain;
};

// Waits for exit under the deadline. On expiry: SIGTERM to the group, a short
// grace, then SIGKILL. Either way the group is swept afterwards and the pipe
// readers get a bounded drain window.
[[nodiscard]] auto supervise(bp::process &proc, SuperviseParams params,
                             boost::asio::steady_timer &drain_timer,
                             PipeCapture &out, PipeCapture &err)
    -> task<WaitOutcome> {
  WaitOutcome outcome;
  auto [ec, exit_code] = co_await proc.async_wait(
      boost::asio::cancel_after(params.timeout, use_nothrow));
  if (!ec) {
    outcome.exit_code = exit_code;
  } else if (ec == boost::asio::error::operation_aborted) {
    outcome.timed_out = true;
    outcome.exit_code = sandbox_defaults::kExitCodeTimeout;
    log::warn("sandbox pid={} exceeded {}s, terminating process group",
              params.pgid, params.timeout.count());
    signal_group(params.pgid, SIGTERM);
    auto [grace_ec, grace_exit] = co_await proc.async_wait(
        boost::asio::cancel_after(params.kill_grace, use_nothrow));
    signal_group(params.pgid, SIGKILL);
    if (grace_ec) {
      auto [kill_ec, kill_exit] = co_await proc.async_wait(use_nothrow);
      if (kill_ec) {
        log::error("sandbox pid={} reap after SIGKILL failed: {}",
                   params.pgid, kill_ec.message());
      }
    }
  } else {
    log::error("sandbox pid={} wait failed: {}", params.pgid, ec.message());
  }

  signal_group(params.pgid, SIGKILL);
  drain_timer.expires_after(params.pipe_drain);
  drain_timer.async_wait([&out, &err](const boost::system::error_code &t_ec) {
    if (!t_ec) {
      out.cancel.emit(boost::asio::cancellation_type::total);
      err.cancel.emit(boost::asio::cancellation_type::total);
    }
  });
  co_return outcome;
}

[[nodiscard]] auto run_process(bp::process &proc, SuperviseParams params,
                               boost::asio::steady_timer &drain_timer,
                               PipeCapture &out, PipeCapture &err)
    -> task<WaitOutcome> {
  using namespace awaitable_ops;
  auto outcome = co_await (read_pipe_all(out) && read_pipe_all(err) &&
                           supervise(proc, params, drain_timer, out, err));
  drain_timer.cancel();
  co_return outcome;
}

[[nodiscard]] auto parse_harness_output(std::string_view stdout_text)
    -> Result<JsonValue> {
  // The harness writes its result as the final line; earlier lines are
  // whatever the user code printed.
  const auto last = last_non_empty_line(stdout_text);
  if (last.empty()) {
    return fail(Error::ParseError);
  }
  if (auto parsed = parse_json(last)) {
    return parsed;
  }
  return parse_json(boost::algorithm::trim_copy(std::string(stdout_text)));
}

[[nodiscard]] auto read_code_file(const fs::path &path)
    -> std::pair<std::optional<std::string>, std::optional<ExecutionResult>> {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return {std::nullopt,
            ExecutionResult::failed(
                FailureKind::FileNotFound,
                std::format("Code file not found: {}", path.string()))};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const bool denied = ::access(path.c_str(), R_OK) != 0 && errno == EACCES;
    return {std::nullopt,
            ExecutionResult::failed(
                denied ? FailureKind::PermissionDenied
                       : FailureKind::FileNotFound,
                denied ? std::format("Permission denied reading file: {}",
                                     path.string())
                       : std::format("Failed to read code file: {}",
                                     path.string()))};
  }
  return {std::string((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>()),
          std::nullopt};
}

[[nodiscard]] auto resolve_executable(const std::string &name)
    -> std::optional<fs::path> {
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0) {
      return fs::path(name);
    }
    return std::nullopt;
  }
  auto found = bp::environment::find_executable(name);
  if (found.empty()) {
    return std::nullopt;
  }
  return fs::path(found.string());
}

} // namespace

CodeSandbox::CodeSandbox(SandboxOptions options)
    : options_(std::move(options)) {}

auto CodeSandbox::find_interpreter(Language language) const
    -> std::optional<fs::path> {
  const auto &configured = language == Language::Javascript
                               ? options_.node_executable
                               : options_.python_executable;
  if (!configured.empty()) {
    return resolve_executable(configured);
  }
  if (language == Language::Javascript) {
    return resolve_executable("node");
  }
  if (auto python3 = resolve_executable("python3")) {
    return python3;
  }
  return resolve_executable("python");
}

auto CodeSandbox::execute(Language language, std::string_view code,
                          const JsonValue &inputs,
                          std::chrono::seconds timeout,
                          const EnvVars &env) const -> ExecutionResult {
  util::Stopwatch stopwatch;
  if (timeout.count() <= 0) {
    log::warn("Non-positive sandbox timeout {}s, using default {}s",
              timeout.count(), sandbox_defaults::kTimeout.count());
    timeout = sandbox_defaults::kTimeout;
  }

  auto interpreter = find_interpreter(language);
  if (!interpreter) {
    const auto command = language == Language::Javascript ? "node" : "python3";
    auto result = ExecutionResult::failed(
        FailureKind::InterpreterNotFound,
        std::format("{} interpreter not found in PATH",
                    language_display_name(language)));
    result.stack_trace = std::format(
        "FileNotFoundError: '{}' command not found in PATH", command);
    result.execution_time = stopwatch.elapsed_seconds();
    return result;
  }

  std::error_code dir_ec;
  const auto temp_dir = options_.temp_dir.empty()
                            ? fs::temp_directory_path(dir_ec)
                            : options_.temp_dir;
  auto script = TempFile::create(temp_dir, source_file_extension(language),
                                 generate_harness(language, code, inputs));
  if (!script) {
    auto result = ExecutionResult::failed(
        FailureKind::SpawnFailed,
        std::format("Failed to create temporary file in {}: {}",
                    temp_dir.string(), script.error().message()));
    result.execution_time = stopwatch.elapsed_seconds();
    return result;
  }

  log::info("sandbox start: language={} interpreter={} timeout={}s code='{}'",
            to_string_view(language), interpreter->string(), timeout.count(),
            code_preview(code));

  boost::asio::io_context io;
  PipeCapture out(io);
  PipeCapture err(io);
  boost::asio::steady_timer drain_timer(io);

  std::optional<bp::process> proc;
  try {
    std::vector<std::string> args{script->path().string()};
    proc.emplace(io, interpreter->string(), args,
                 bp::process_stdio{.in = nullptr, .out = out.pipe,
                                   .err = err.pipe},
                 build_process_env(env), ProcessGroupLeader{});
  } catch (const std::exception &ex) {
    log::error("sandbox spawn failed: {}", ex.what());
    auto result = ExecutionResult::failed(
        FailureKind::SpawnFailed,
        std::format("Failed to start {} process: {}",
                    language_display_name(language), ex.what()));
    result.execution_time = stopwatch.elapsed_seconds();
    return result;
  }

  const pid_t pgid = proc->id();
  // The child calls setpgid() itself; doing it here too closes the window
  // before the child gets there. EACCES means the child already exec'd.
  if (::setpgid(pgid, pgid) != 0 && errno != EACCES && errno != ESRCH) {
    log::debug("setpgid({}) from parent failed: {}", pgid,
               std::strerror(errno));
  }
  ProcessGroupGuard group_guard(pgid);

  WaitOutcome outcome;
  try {
    outcome = run_blocking(
        io, run_process(*proc,
                        SuperviseParams{.pgid = pgid,
                                        .timeout = timeout,
                                        .kill_grace = options_.kill_grace,
                                        .pipe_drain = options_.pipe_drain},
                        drain_timer, out, err));
  } catch (const std::exception &ex) {
    log::error("sandbox supervision failed pid={}: {}", pgid, ex.what());
    auto result = ExecutionResult::failed(
        FailureKind::SpawnFailed,
        std::format("Sandbox supervision failed: {}", ex.what()));
    result.execution_time = stopwatch.elapsed_seconds();
    return result;
  }

  ExecutionResult result;
  result.execution_time = stopwatch.elapsed_seconds();
  result.exit_code = outcome.exit_code;
  if (!out.text.empty()) {
    result.stdout_output = out.text;
  }
  if (!err.text.empty()) {
    result.stderr_output = err.text;
  }

  if (outcome.timed_out) {
    result.timed_out = true;
    result.failure = FailureKind::Timeout;
    result.error = std::format("Execution timed out after {} seconds",
                               timeout.count());
  } else if (outcome.exit_code != 0) {
    result.failure = FailureKind::UserCode;
    const auto last_err = last_non_empty_line(err.text);
    result.error =
        last_err.empty()
            ? std::format("Code execution failed with exit code {}",
                          outcome.exit_code)
            : std::format("Code execution failed with exit code {}: {}",
                          outcome.exit_code, last_err);
    result.stack_trace = extract_stack_trace(language, err.text);
  } else if (auto parsed = parse_harness_output(out.text)) {
    result.success = true;
    result.output = std::move(*parsed);
  } else {
    result.failure = FailureKind::OutputParse;
    result.error = std::format("Failed to parse output as JSON: {}",
                               code_preview(last_non_empty_line(out.text)));
  }

  log::info("sandbox finish: pid={} exit_code={} timed_out={} elapsed={:.3f}s",
            pgid, outcome.exit_code, outcome.timed_out, result.execution_time);
  return result;
}

auto CodeSandbox::execute_file(const fs::path &path, Language language,
                               const JsonValue &inputs,
                               std::chrono::seconds timeout,
                               const EnvVars &env) const -> ExecutionResult {
  auto [code, failure] = read_code_file(path);
  if (failure) {
    log::error("{}", failure->error.value_or(""));
    return std::move(*failure);
  }
  return execute(language, *code, inputs, timeout, env);
}

auto CodeSandbox::execute(const CodeSpec &spec, const JsonValue &inputs) const
    -> ExecutionResult {
  if (spec.code) {
    return execute(spec.language, *spec.code, inputs, spec.timeout,
                   spec.env_vars);
  }
  if (spec.code_file) {
    return execute_file(*spec.code_file, spec.language, inputs, spec.timeout,
                        spec.env_vars);
  }
  return ExecutionResult::failed(FailureKind::FileNotFound,
                                 "Code spec carries no code");
}

} // namespace evalflow
