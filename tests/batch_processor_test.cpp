#include "evalflow/batch/batch_processor.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <stdexcept>

using namespace evalflow;
using namespace std::chrono_literals;

namespace {

auto numbers(int count) -> std::vector<JsonValue> {
  std::vector<JsonValue> items;
  for (int i = 0; i < count; ++i) {
    items.emplace_back(static_cast<std::int64_t>(i));
  }
  return items;
}

auto square(const JsonValue &item) -> JsonValue {
  const auto n = *item.get_if<std::int64_t>();
  return JsonValue(n * n);
}

} // namespace

class BatchProcessorTest : public ::testing::Test {
protected:
  BatchProcessor processor_{4};
};

TEST_F(BatchProcessorTest, SequentialPreservesOrder) {
  auto items = numbers(7);
  auto results = processor_.process_in_batches(items, square, 3, false);
  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(results->size(), 7);
  for (std::int64_t i = 0; i < 7; ++i) {
    EXPECT_EQ(*(*results)[i].get_if<std::int64_t>(), i * i);
  }
}

TEST_F(BatchProcessorTest, ConcurrentMatchesSequential) {
  auto items = numbers(25);
  auto slow_square = [](const JsonValue &item) {
    const auto n = *item.get_if<std::int64_t>();
    test::sleep_ms(std::chrono::milliseconds((25 - n) % 4));
    return JsonValue(n * n);
  };
  auto sequential = processor_.process_in_batches(items, slow_square, 4, false);
  auto concurrent = processor_.process_in_batches(items, slow_square, 4, true);
  ASSERT_TRUE(sequential.has_value());
  ASSERT_TRUE(concurrent.has_value());
  ASSERT_EQ(sequential->size(), concurrent->size());
  for (std::size_t i = 0; i < sequential->size(); ++i) {
    EXPECT_EQ(dump_json((*sequential)[i]), dump_json((*concurrent)[i]));
  }
}

TEST_F(BatchProcessorTest, FailedItemBecomesNull) {
  auto items = numbers(6);
  auto flaky = [](const JsonValue &item) -> JsonValue {
    const auto n = *item.get_if<std::int64_t>();
    if (n == 2 || n == 5) {
      throw std::runtime_error("bad item");
    }
    return JsonValue(n + 100);
  };
  auto detailed = processor_.process_in_batches_detailed(items, flaky, 2, true);
  EXPECT_TRUE(detailed.success);
  ASSERT_EQ(detailed.results.size(), 6);
  EXPECT_TRUE(detailed.results[2].is_null());
  EXPECT_TRUE(detailed.results[5].is_null());
  EXPECT_EQ(*detailed.results[3].get_if<std::int64_t>(), 103);
  EXPECT_EQ(detailed.failed_indices, (std::vector<std::size_t>{2, 5}));
  EXPECT_EQ(detailed.batch_count, 3);
  EXPECT_EQ(detailed.total_items, 6);
}

TEST_F(BatchProcessorTest, EachItemProcessedExactlyOnce) {
  std::atomic<int> calls{0};
  auto items = numbers(33);
  auto counted = [&](const JsonValue &item) {
    ++calls;
    return item;
  };
  auto results = processor_.process_in_batches(items, counted, 5, true);
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(calls.load(), 33);
}

TEST_F(BatchProcessorTest, EmptyInputYieldsEmptyOutput) {
  std::vector<JsonValue> items;
  auto results = processor_.process_in_batches(items, square, 10, true);
  ASSERT_TRUE(results.has_value());
  EXPECT_TRUE(results->empty());
}

TEST_F(BatchProcessorTest, InvalidBatchSizeRejected) {
  auto items = numbers(3);
  auto results = processor_.process_in_batches(items, square, 0, true);
  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error(), make_error_code(Error::InvalidBatchSize));

  auto detailed = processor_.process_in_batches_detailed(items, square, -2);
  EXPECT_FALSE(detailed.success);
  EXPECT_EQ(detailed.error.value_or(""),
            "batch size must be a positive integer, got -2");
  EXPECT_TRUE(detailed.results.empty());
}

TEST_F(BatchProcessorTest, BatchLargerThanInputRunsOnce) {
  auto items = numbers(3);
  auto detailed = processor_.process_in_batches_detailed(items, square, 100);
  EXPECT_TRUE(detailed.success);
  EXPECT_EQ(detailed.batch_count, 1);
  EXPECT_TRUE(detailed.failed_indices.empty());
}
