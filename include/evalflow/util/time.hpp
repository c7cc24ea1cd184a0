#pragma once

#include <chrono>

namespace evalflow::util {

// Monotonic wall-clock timer reporting seconds as double.
class Stopwatch {
public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}

  auto reset() -> void { start_ = std::chrono::steady_clock::now(); }

  [[nodiscard]] auto elapsed() const -> std::chrono::steady_clock::duration {
    return std::chrono::steady_clock::now() - start_;
  }

  [[nodiscard]] auto elapsed_seconds() const -> double {
    return std::chrono::duration<double>(elapsed()).count();
  }

private:
  std::chrono::steady_clock::time_point start_;
};

} // namespace evalflow::util
