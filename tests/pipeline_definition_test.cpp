#include "evalflow/config/pipeline_definition.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace evalflow;
using namespace std::chrono_literals;

TEST(PipelineDefinitionTest, LoadsEveryStepType) {
  std::string toml = R"(
id = "qa_eval"
name = "QA evaluation"

[[steps]]
id = "answer"
type = "agent_flow"
agent = "qa_agent"
flow = "answer"
model_override = "small"
output_key = "answer"
input_mapping = { question = "question" }

[[steps]]
id = "score"
type = "code_node"
language = "python"
code = "def transform(inputs):\n    return len(inputs['answer'])\n"
timeout = 5
output_key = "score"
input_mapping = { answer = "answer" }
env = { SCORER_MODE = "strict" }

[[steps]]
id = "summary"
type = "batch_aggregator"
aggregation_strategy = "filter"
condition = "score >= 3"
output_key = "good"
input_mapping = { items = "scored" }
)";

  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_string(toml, &diagnostic);
  ASSERT_TRUE(def.has_value()) << diagnostic;
  EXPECT_EQ(def->id, "qa_eval");
  EXPECT_EQ(def->name, "QA evaluation");
  ASSERT_EQ(def->steps.size(), 3);

  const auto &answer = def->steps[0];
  ASSERT_EQ(step_type(answer.kind), StepType::AgentFlow);
  const auto &agent = std::get<AgentFlowStep>(answer.kind);
  EXPECT_EQ(agent.agent, "qa_agent");
  EXPECT_EQ(agent.model_override.value_or(""), "small");
  ASSERT_EQ(answer.input_mapping.size(), 1);
  EXPECT_EQ(answer.input_mapping[0].param, "question");

  const auto &score = std::get<CodeNodeStep>(def->steps[1].kind);
  EXPECT_TRUE(score.code.is_inline());
  EXPECT_EQ(score.code.timeout, 5s);
  EXPECT_EQ(score.code.env_vars.at("SCORER_MODE"), "strict");

  const auto &summary = std::get<BatchAggregatorStep>(def->steps[2].kind);
  EXPECT_EQ(summary.strategy, AggregationStrategy::Filter);
  EXPECT_EQ(summary.condition_text, "score >= 3");
  ASSERT_TRUE(static_cast<bool>(summary.params.condition));
  EXPECT_TRUE(summary.params.condition(test::json(R"({"score":4})")));
}

TEST(PipelineDefinitionTest, BatchModeOptions) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "judge_all"
agent = "judge"
output_key = "verdicts"
batch_mode = true
batch_size = 3
concurrent = false
max_workers = 6
items_param = "answers"
)";
  auto def = PipelineDefinitionLoader::load_from_string(toml);
  ASSERT_TRUE(def.has_value());
  const auto &batch = def->steps[0].batch;
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->batch_size, 3);
  EXPECT_FALSE(batch->concurrent);
  EXPECT_EQ(batch->max_workers, 6);
  EXPECT_EQ(batch->items_param, "answers");
  EXPECT_EQ(std::get<AgentFlowStep>(def->steps[0].kind).flow, "default");
}

TEST(PipelineDefinitionTest, OversizedBatchSizeRejected) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "judge_all"
agent = "judge"
output_key = "verdicts"
batch_mode = true
batch_size = 4294967297
)";
  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_string(toml, &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diagnostic.find("batch_size 4294967297 is too large"),
            std::string::npos);
}

TEST(PipelineDefinitionTest, CodeAndCodeFileTogetherRejected) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "both"
type = "code_node"
code = "x = 1"
code_file = "x.py"
output_key = "out"
)";
  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_string(toml, &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diagnostic.find("set only one of 'code' and 'code_file'"),
            std::string::npos);
}

TEST(PipelineDefinitionTest, NeitherCodeNorCodeFileRejected) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "empty"
type = "code_node"
output_key = "out"
)";
  std::string diagnostic;
  EXPECT_FALSE(
      PipelineDefinitionLoader::load_from_string(toml, &diagnostic).has_value());
  EXPECT_NE(diagnostic.find("one of 'code' or 'code_file' is required"),
            std::string::npos);
}

TEST(PipelineDefinitionTest, AllProblemsReportedTogether) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "a"
type = "teleport"
output_key = "x"

[[steps]]
id = "b"
type = "batch_aggregator"
aggregation_strategy = "stats"
output_key = "y"

[[steps]]
id = "c"
type = "code_node"
language = "ruby"
code = "puts 1"
output_key = "z"
)";
  std::string diagnostic;
  ASSERT_FALSE(
      PipelineDefinitionLoader::load_from_string(toml, &diagnostic).has_value());
  EXPECT_NE(diagnostic.find("unknown step type 'teleport'"), std::string::npos);
  EXPECT_NE(diagnostic.find("stats aggregation needs at least one field"),
            std::string::npos);
  EXPECT_NE(diagnostic.find("unsupported language 'ruby'"), std::string::npos);
  EXPECT_NE(diagnostic.find("; "), std::string::npos);
}

TEST(PipelineDefinitionTest, DuplicateIdsAndOutputKeysRejected) {
  std::string toml = R"(
id = "p"

[[steps]]
id = "same"
agent = "a"
output_key = "out"

[[steps]]
id = "same"
agent = "b"
output_key = "out"
)";
  std::string diagnostic;
  ASSERT_FALSE(
      PipelineDefinitionLoader::load_from_string(toml, &diagnostic).has_value());
  EXPECT_NE(diagnostic.find("Duplicate step ID: 'same'"), std::string::npos);
  EXPECT_NE(diagnostic.find("output_key 'out'"), std::string::npos);
}

TEST(PipelineDefinitionTest, MissingIdRejected) {
  std::string diagnostic;
  auto def = PipelineDefinitionLoader::load_from_string(
      "[[steps]]\nid = \"a\"\nagent = \"x\"\noutput_key = \"o\"\n",
      &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_TRUE(diagnostic.starts_with(
      "Pipeline parse error: missing required top-level field 'id'"));
}

TEST(PipelineDefinitionTest, NoStepsRejected) {
  std::string diagnostic;
  EXPECT_FALSE(PipelineDefinitionLoader::load_from_string("id = \"p\"\n",
                                                          &diagnostic)
                   .has_value());
  EXPECT_EQ(diagnostic, "Pipeline must have at least one step");
}

TEST(PipelineDefinitionTest, RelativeCodeFileResolvesAgainstDefinition) {
  test::TempDir dir;
  dir.write("scripts/score.py", "def transform(inputs):\n    return 1\n");
  auto path = dir.write("pipeline.toml", R"(
id = "p"

[[steps]]
id = "score"
type = "code_node"
code_file = "scripts/score.py"
output_key = "score"
)");
  auto def = PipelineDefinitionLoader::load_from_file(path.string());
  ASSERT_TRUE(def.has_value());
  const auto &code = std::get<CodeNodeStep>(def->steps[0].kind).code;
  ASSERT_TRUE(code.code_file.has_value());
  EXPECT_EQ(*code.code_file, dir.path() / "scripts/score.py");
}

TEST(PipelineDefinitionTest, ValidateDefinitionBuiltInCode) {
  PipelineDefinition def{.id = "p"};
  def.steps.push_back(StepConfig{.id = StepId{"a"},
                                 .kind = AgentFlowStep{},
                                 .output_key = ""});
  auto errors = validate_definition(def);
  ASSERT_EQ(errors.size(), 2);
  EXPECT_EQ(errors[0], "Step 'a': output_key cannot be empty");
  EXPECT_EQ(errors[1], "Step 'a': agent flow step needs 'agent'");
}
