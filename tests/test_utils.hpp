#pragma once

#include "evalflow/sandbox/sandbox.hpp"
#include "evalflow/util/id.hpp"
#include "evalflow/util/json.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace evalflow::test {

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "evalflow_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

// Removes the directory tree on scope exit.
class TempDir {
public:
  explicit TempDir(std::string_view prefix = "evalflow_test_")
      : path_(make_temp_dir(prefix)) {
    if (path_.empty()) {
      throw std::runtime_error("mkdtemp failed");
    }
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }

  auto write(std::string_view name, std::string_view content) const
      -> std::filesystem::path {
    auto file = path_ / name;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
  }

private:
  std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(std::string name, const std::string &value)
      : name_(std::move(name)) {
    if (const char *old = std::getenv(name_.c_str())) {
      previous_ = old;
    }
    ::setenv(name_.c_str(), value.c_str(), 1);
  }
  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

[[nodiscard]] inline auto has_interpreter(Language language) -> bool {
  return CodeSandbox{}.find_interpreter(language).has_value();
}

[[nodiscard]] inline auto json(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  if (!parsed) {
    throw std::runtime_error("invalid JSON in test: " + std::string(text));
  }
  return std::move(*parsed);
}

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

} // namespace evalflow::test
