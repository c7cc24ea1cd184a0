#pragma once

#include "evalflow/core/constants.hpp"
#include "evalflow/core/error.hpp"
#include "evalflow/util/json.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace evalflow {

using ItemProcessor = std::function<JsonValue(const JsonValue &)>;

struct BatchProcessingResult {
  bool success{false};
  // One slot per input item; a failed item is null.
  std::vector<JsonValue> results;
  std::size_t total_items{0};
  std::size_t batch_count{0};
  std::vector<std::size_t> failed_indices;
  double execution_time{0.0};
  std::optional<std::string> error;
};

/// Applies a per-item function to fixed-size contiguous batches. Output order
/// always matches input order.
class BatchProcessor {
public:
  explicit BatchProcessor(
      std::size_t max_workers = batch_defaults::kMaxWorkers);

  /// Fails only for batch_size < 1. Item faults become null slots.
  [[nodiscard]] auto process_in_batches(std::span<const JsonValue> items,
                                        const ItemProcessor &processor,
                                        int batch_size = batch_defaults::kBatchSize,
                                        bool concurrent = batch_defaults::kConcurrent) const
      -> Result<std::vector<JsonValue>>;

  /// Never fails; an invalid batch size is reported in the result.
  [[nodiscard]] auto
  process_in_batches_detailed(std::span<const JsonValue> items,
                              const ItemProcessor &processor,
                              int batch_size = batch_defaults::kBatchSize,
                              bool concurrent = batch_defaults::kConcurrent) const
      -> BatchProcessingResult;

  [[nodiscard]] auto max_workers() const noexcept -> std::size_t {
    return max_workers_;
  }

private:
  struct Outcome {
    std::vector<JsonValue> results;
    std::vector<std::size_t> failed_indices;
    std::size_t batch_count{0};
  };

  [[nodiscard]] auto run(std::span<const JsonValue> items,
                         const ItemProcessor &processor,
                         std::size_t batch_size, bool concurrent) const
      -> Outcome;

  std::size_t max_workers_;
};

} // namespace evalflow
