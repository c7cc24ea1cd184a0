#pragma once

#include <chrono>
#include <cstddef>

namespace evalflow {

namespace io {
constexpr std::size_t kReadBufferSize = 4096;
constexpr std::size_t kInitialOutputReserve = 8192;
constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
} // namespace io

namespace sandbox_defaults {
constexpr auto kTimeout = std::chrono::seconds(30);
constexpr auto kKillGrace = std::chrono::milliseconds(500);
constexpr auto kPipeDrain = std::chrono::milliseconds(1000);
constexpr int kExitCodeTimeout = 124;
} // namespace sandbox_defaults

namespace scheduler_defaults {
constexpr std::size_t kMaxWorkers = 4;
} // namespace scheduler_defaults

namespace batch_defaults {
constexpr int kBatchSize = 10;
constexpr bool kConcurrent = true;
constexpr std::size_t kMaxWorkers = 4;
} // namespace batch_defaults

} // namespace evalflow
