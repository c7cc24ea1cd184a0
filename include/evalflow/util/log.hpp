#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

namespace evalflow::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Redirect request processed in order with the log lines around it.
struct Redirect {
  std::string path; // empty = back to the default stream
};

using Entry = std::variant<std::string, Redirect>;

// Async logger: producers try_send formatted lines into a concurrent_channel,
// a single writer thread drains them in batches. Before start() (and after
// stop()) lines are written synchronously under a mutex.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kMaxBatch = 64;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Entry)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> default_out_{stderr};
  std::atomic<std::uint64_t> dropped_{0};
  std::mutex sync_mu_;
  FILE *file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;

  [[nodiscard]] auto current_out() noexcept -> FILE * {
    return file_ ? file_ : default_out_.load(std::memory_order_acquire);
  }

  auto apply(Redirect &redirect) -> void {
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (redirect.path.empty()) {
      return;
    }
    if (FILE *f = std::fopen(redirect.path.c_str(), "a"); f) {
      std::setvbuf(f, nullptr, _IOLBF, 0);
      file_ = f;
    }
  }

  auto write(Entry &entry) -> void {
    if (auto *redirect = std::get_if<Redirect>(&entry)) {
      apply(*redirect);
      return;
    }
    const auto &line = std::get<std::string>(entry);
    std::fwrite(line.data(), 1, line.size(), current_out());
  }

  auto writer_loop(std::shared_ptr<Channel> channel) -> void {
    std::vector<Entry> batch;
    batch.reserve(kMaxBatch);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      channel->async_receive(
          [&](const boost::system::error_code &ec, Entry entry) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(entry));
            }
          });
      channel_ctx_.restart();
      (void)channel_ctx_.run_one();
      if (recv_ec) {
        break;
      }

      while (batch.size() < kMaxBatch &&
             channel->try_receive(
                 [&](const boost::system::error_code &ec, Entry entry) {
                   if (!ec) {
                     batch.push_back(std::move(entry));
                   }
                 })) {
      }

      std::scoped_lock lock(sync_mu_);
      for (auto &entry : batch) {
        write(entry);
      }
      std::fflush(current_out());
      batch.clear();
    }

    std::scoped_lock lock(sync_mu_);
    while (channel->try_receive(
        [&](const boost::system::error_code &ec, Entry entry) {
          if (!ec) {
            write(entry);
          }
        })) {
    }
    std::fflush(current_out());
  }

  template <typename... Args>
  [[nodiscard]] static auto format_line(Level level,
                                        std::format_string<Args...> fmt,
                                        Args &&...args) -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const bool tty = ::isatty(::fileno(stderr)) != 0;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                       tty ? level_colors.at(std::to_underlying(level)) : "",
                       level_name(level), tty ? "\o{33}[0m" : "", tid,
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    auto channel =
        std::make_shared<Channel>(channel_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    channel_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    default_out_.store(stderr, std::memory_order_release);
  }

  auto set_output_stdout() noexcept -> void {
    default_out_.store(stdout, std::memory_order_release);
  }

  auto set_output_file(std::string_view path) -> bool {
    Redirect redirect{.path = std::string(path)};
    if (auto channel = channel_.load(std::memory_order_acquire)) {
      return channel->try_send(boost::system::error_code{},
                               Entry{std::move(redirect)});
    }
    std::scoped_lock lock(sync_mu_);
    apply(redirect);
    return path.empty() || file_ != nullptr;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, fmt, std::forward<Args>(args)...);

    if (auto channel = channel_.load(std::memory_order_acquire)) {
      if (channel->try_send(boost::system::error_code{}, Entry{line})) {
        return;
      }
      // Queue full: drop rather than block a worker thread.
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    std::scoped_lock lock(sync_mu_);
    FILE *out = current_out();
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace evalflow::log
