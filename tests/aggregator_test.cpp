#include "evalflow/batch/aggregator.hpp"
#include "evalflow/batch/filter_condition.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace evalflow;
using namespace std::chrono_literals;
using evalflow::test::json;

namespace {

auto items_of(std::string_view array_text) -> std::vector<JsonValue> {
  auto doc = json(array_text);
  const auto &arr = doc.get_array();
  return {arr.begin(), arr.end()};
}

auto number_at(const JsonValue &obj, std::string_view key) -> double {
  const auto *member = find_member(obj, key);
  if (!member) {
    ADD_FAILURE() << "missing key " << key;
    return 0.0;
  }
  return as_number(*member).value_or(-1.0);
}

} // namespace

class AggregatorTest : public ::testing::Test {
protected:
  Aggregator aggregator_;
};

TEST_F(AggregatorTest, ConcatJoinsWithSeparator) {
  auto items = items_of(R"(["a","b","c"])");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Concat,
                                      AggregationParams{.separator = "-"});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(stringify(result.result), "a-b-c");
  EXPECT_EQ(result.item_count, 3);
  EXPECT_EQ(result.strategy, AggregationStrategy::Concat);
}

TEST_F(AggregatorTest, ConcatProjectsTextFields) {
  auto items = items_of(R"([{"text":"one"},{"output":2},{"other":true}])");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Concat);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(stringify(result.result), "one\n2\n{\"other\":true}");
}

TEST_F(AggregatorTest, StatsOverScoreField) {
  auto items = items_of(R"([{"score":85},{"score":90},{"score":78}])");
  auto result = aggregator_.aggregate(
      items, AggregationStrategy::Stats,
      AggregationParams{.fields = {"score"}});
  ASSERT_TRUE(result.success) << result.error.value_or("");

  EXPECT_EQ(number_at(result.result, "total_items"), 3);
  const auto *fields = find_member(result.result, "fields");
  ASSERT_NE(fields, nullptr);
  const auto *score = find_member(*fields, "score");
  ASSERT_NE(score, nullptr);
  EXPECT_EQ(number_at(*score, "count"), 3);
  EXPECT_EQ(number_at(*score, "sum"), 253);
  EXPECT_NEAR(number_at(*score, "mean"), 84.333, 0.001);
  EXPECT_EQ(number_at(*score, "min"), 78);
  EXPECT_EQ(number_at(*score, "max"), 90);
  EXPECT_EQ(number_at(*score, "median"), 85);
  EXPECT_NEAR(number_at(*score, "stdev"), 6.028, 0.001);
}

TEST_F(AggregatorTest, StatsSingleValueHasNoSpread) {
  auto items = items_of(R"([{"score":5}])");
  auto result = aggregator_.aggregate(
      items, AggregationStrategy::Stats,
      AggregationParams{.fields = {"score"}});
  ASSERT_TRUE(result.success);
  const auto *score = find_member(*find_member(result.result, "fields"), "score");
  ASSERT_NE(score, nullptr);
  EXPECT_EQ(find_member(*score, "stdev"), nullptr);
  EXPECT_EQ(number_at(*score, "mean"), 5);
}

TEST_F(AggregatorTest, StatsFieldWithoutNumbers) {
  auto items = items_of(R"([{"score":"n/a"},{"other":1}])");
  auto result = aggregator_.aggregate(
      items, AggregationStrategy::Stats,
      AggregationParams{.fields = {"score"}});
  ASSERT_TRUE(result.success);
  const auto *score = find_member(*find_member(result.result, "fields"), "score");
  ASSERT_NE(score, nullptr);
  EXPECT_EQ(number_at(*score, "count"), 0);
  EXPECT_EQ(stringify(*find_member(*score, "error")), "No numeric values found");
}

TEST_F(AggregatorTest, StatsWithoutFieldsFails) {
  auto items = items_of(R"([{"score":1}])");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Stats);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""),
            "No fields specified for stats aggregation");
}

TEST_F(AggregatorTest, FilterKeepsMatchingItemsInOrder) {
  auto items = items_of(R"([{"s":1},{"s":9},{"s":4},{"s":7}])");
  auto condition = FilterCondition::parse("s >= 4");
  ASSERT_TRUE(condition.has_value());
  auto result = aggregator_.aggregate(
      items, AggregationStrategy::Filter,
      AggregationParams{.condition = condition->predicate()});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(dump_json(result.result), R"([{"s":9},{"s":4},{"s":7}])");
}

TEST_F(AggregatorTest, FilterWithoutConditionKeepsAll) {
  auto items = items_of("[1,2,3]");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Filter);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(dump_json(result.result), "[1,2,3]");
}

TEST_F(AggregatorTest, ThrowingPredicateIsReportedNotPropagated) {
  auto items = items_of("[1]");
  auto result = aggregator_.aggregate(
      items, AggregationStrategy::Filter,
      AggregationParams{.condition = [](const JsonValue &) -> bool {
        throw std::runtime_error("predicate exploded");
      }});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "predicate exploded");
}

TEST_F(AggregatorTest, EmptyInputSucceedsWithNullForEveryStrategy) {
  std::vector<JsonValue> none;
  for (auto strategy :
       {AggregationStrategy::Concat, AggregationStrategy::Stats,
        AggregationStrategy::Filter, AggregationStrategy::Custom}) {
    auto result = aggregator_.aggregate(none, strategy);
    EXPECT_TRUE(result.success) << to_string_view(strategy);
    EXPECT_TRUE(result.result.is_null());
    EXPECT_EQ(result.item_count, 0);
  }
}

TEST_F(AggregatorTest, UnknownStrategyNameRejected) {
  auto items = items_of("[1]");
  auto result = aggregator_.aggregate(items, "median_of_medians");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::UnknownStrategy));

  auto named = aggregator_.aggregate(items, "concat");
  ASSERT_TRUE(named.has_value());
  EXPECT_TRUE(named->success);
}

TEST_F(AggregatorTest, CustomWithoutCodeFails) {
  auto items = items_of("[1]");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Custom);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""),
            "Custom aggregation code cannot be empty");
}

TEST_F(AggregatorTest, CustomRunsCodeOverItems) {
  if (!test::has_interpreter(Language::Python)) {
    GTEST_SKIP() << "python3 not available";
  }
  auto code = CodeSpec::builder()
                  .code("def aggregate(items):\n"
                        "    return {'best': max(i['s'] for i in items)}\n")
                  .timeout(10s)
                  .build();
  ASSERT_TRUE(code.has_value());
  auto items = items_of(R"([{"s":3},{"s":11},{"s":5}])");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Custom,
                                      AggregationParams{.code = *code});
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(dump_json(result.result), R"({"best":11})");
}

TEST_F(AggregatorTest, CustomFailureCarriesStackTrace) {
  if (!test::has_interpreter(Language::Python)) {
    GTEST_SKIP() << "python3 not available";
  }
  auto code = CodeSpec::builder()
                  .code("def aggregate(items):\n    return 1 / 0\n")
                  .timeout(10s)
                  .build();
  ASSERT_TRUE(code.has_value());
  auto items = items_of("[1]");
  auto result = aggregator_.aggregate(items, AggregationStrategy::Custom,
                                      AggregationParams{.code = *code});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.error.value_or("").starts_with(
      "Custom aggregation code execution failed: "));
  ASSERT_TRUE(result.stack_trace.has_value());
  EXPECT_NE(result.stack_trace->find("ZeroDivisionError"), std::string::npos);
}

TEST(AggregationStrategyTest, ParseStrategy) {
  EXPECT_EQ(parse_strategy("stats").value(), AggregationStrategy::Stats);
  EXPECT_EQ(parse_strategy("CUSTOM").value(), AggregationStrategy::Custom);
  EXPECT_FALSE(parse_strategy("avg").has_value());
}

TEST(AggregationStrategyTest, ResultToJson) {
  AggregationResult result{.success = true,
                           .result = JsonValue(std::string("x")),
                           .strategy = AggregationStrategy::Concat,
                           .item_count = 1};
  auto doc = to_json(result);
  EXPECT_EQ(stringify(*find_member(doc, "strategy")), "concat");
  EXPECT_EQ(stringify(*find_member(doc, "result")), "x");
  EXPECT_TRUE(find_member(doc, "error")->is_null());
}
