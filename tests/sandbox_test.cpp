#include "evalflow/sandbox/sandbox.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace evalflow;
using namespace std::chrono_literals;
using evalflow::test::json;

namespace {

// True once `pid` has exited: gone from /proc or a zombie awaiting reap.
auto process_gone(pid_t pid) -> bool {
  std::ifstream stat(std::format("/proc/{}/stat", pid));
  if (!stat) {
    return true;
  }
  std::string line;
  std::getline(stat, line);
  const auto close = line.rfind(')');
  return close != std::string::npos && close + 2 < line.size() &&
         line[close + 2] == 'Z';
}

} // namespace

class SandboxTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!test::has_interpreter(Language::Python)) {
      GTEST_SKIP() << "python3 not available";
    }
  }

  CodeSandbox sandbox_;
};

TEST_F(SandboxTest, TransformReturnsJson) {
  auto result = sandbox_.execute(
      Language::Python,
      "def transform(inputs):\n    return {'sum': inputs['a'] + inputs['b']}\n",
      json(R"({"a":2,"b":3})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(dump_json(result.output), R"({"sum":5})");
  EXPECT_FALSE(result.error.has_value());
  EXPECT_GT(result.execution_time, 0.0);
}

TEST_F(SandboxTest, PrintsBeforeResultAreIgnored) {
  auto result = sandbox_.execute(
      Language::Python,
      "def main(inputs):\n    print('working...')\n    return [1, 2, 3]\n",
      json("{}"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "[1,2,3]");
  ASSERT_TRUE(result.stdout_output.has_value());
  EXPECT_NE(result.stdout_output->find("working..."), std::string::npos);
}

TEST_F(SandboxTest, PrintedJsonDoesNotReplaceReturnValue) {
  auto result = sandbox_.execute(
      Language::Python,
      "import json\n"
      "def transform(inputs):\n"
      "    print(json.dumps({'debug': 1}))\n"
      "    return {'answer': 42}\n",
      json("{}"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), R"({"answer":42})");
}

TEST_F(SandboxTest, AggregateReceivesItems) {
  auto result = sandbox_.execute(
      Language::Python, "def aggregate(items):\n    return len(items)\n",
      json(R"({"items":[1,2,3,4]})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "4");
}

TEST_F(SandboxTest, NoEntryPointEchoesInputs) {
  auto result = sandbox_.execute(Language::Python, "x = 1\n",
                                 json(R"({"k":"v"})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), R"({"k":"v"})");
}

TEST_F(SandboxTest, RaisedExceptionCarriesStackTrace) {
  auto result = sandbox_.execute(
      Language::Python,
      "def transform(inputs):\n    raise ValueError(\"bad\")\n", json("{}"),
      10s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::UserCode);
  ASSERT_TRUE(result.exit_code.has_value());
  EXPECT_NE(*result.exit_code, 0);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_NE(result.error->find("ValueError: bad"), std::string::npos);
  ASSERT_TRUE(result.stack_trace.has_value());
  EXPECT_NE(result.stack_trace->find("ValueError"), std::string::npos);
  EXPECT_NE(result.stack_trace->find("bad"), std::string::npos);
  EXPECT_TRUE(result.output.is_null());
}

TEST_F(SandboxTest, NonJsonResultIsOutputParseFailure) {
  auto result = sandbox_.execute(
      Language::Python,
      "import sys\nprint('not json')\nsys.exit(0)\n", json("{}"), 10s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::OutputParse);
}

TEST_F(SandboxTest, EnvironmentVariablesReachTheChild) {
  auto result = sandbox_.execute(
      Language::Python,
      "import os\ndef transform(inputs):\n"
      "    return os.environ.get('EVALFLOW_TEST_VALUE')\n",
      json("{}"), 10s, EnvVars{{"EVALFLOW_TEST_VALUE", "hello"}});
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "\"hello\"");
}

TEST_F(SandboxTest, TimeoutKillsWholeProcessGroup) {
  test::TempDir dir;
  const auto pid_file = dir.path() / "child.pid";
  const auto code = std::format(
      "import subprocess, time\n"
      "def transform(inputs):\n"
      "    child = subprocess.Popen(['sleep', '30'])\n"
      "    with open('{}', 'w') as f:\n"
      "        f.write(str(child.pid))\n"
      "    time.sleep(30)\n"
      "    return 'unreachable'\n",
      pid_file.string());

  const auto start = std::chrono::steady_clock::now();
  auto result = sandbox_.execute(Language::Python, code, json("{}"), 1s);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.failure, FailureKind::Timeout);
  EXPECT_EQ(result.exit_code, 124);
  EXPECT_TRUE(result.output.is_null());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, "Execution timed out after 1 seconds");
  EXPECT_LT(elapsed, 1s + sandbox_defaults::kKillGrace + 1s);

  std::ifstream in(pid_file);
  pid_t child_pid = 0;
  in >> child_pid;
  ASSERT_GT(child_pid, 0);
  EXPECT_TRUE(test::poll_until([&] { return process_gone(child_pid); }, 3s));
}

TEST_F(SandboxTest, TempFilesRemovedOnEveryExitPath) {
  test::TempDir dir;
  CodeSandbox sandbox(SandboxOptions{.temp_dir = dir.path()});
  auto leftovers = [&] {
    std::size_t count = 0;
    for (const auto &entry : std::filesystem::directory_iterator(dir.path())) {
      if (entry.path().filename().string().starts_with("evalflow_")) {
        ++count;
      }
    }
    return count;
  };

  auto ok = sandbox.execute(Language::Python,
                            "def transform(inputs):\n    return 1\n",
                            json("{}"), 10s);
  EXPECT_TRUE(ok.success) << ok.describe();
  EXPECT_EQ(leftovers(), 0);

  auto raised = sandbox.execute(
      Language::Python, "def transform(inputs):\n    raise ValueError('x')\n",
      json("{}"), 10s);
  EXPECT_FALSE(raised.success);
  EXPECT_EQ(leftovers(), 0);

  auto timed_out = sandbox.execute(
      Language::Python,
      "import time\ndef transform(inputs):\n    time.sleep(30)\n",
      json("{}"), 1s);
  EXPECT_TRUE(timed_out.timed_out);
  EXPECT_EQ(leftovers(), 0);
}

TEST_F(SandboxTest, NonPositiveTimeoutFallsBackToDefault) {
  auto result = sandbox_.execute(
      Language::Python, "def transform(inputs):\n    return 1\n", json("{}"),
      0s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "1");
}

TEST_F(SandboxTest, ExecuteFileRunsCodeFromDisk) {
  test::TempDir dir;
  auto path = dir.write("double.py",
                        "def transform(inputs):\n    return inputs['n'] * 2\n");
  auto result =
      sandbox_.execute_file(path, Language::Python, json(R"({"n":21})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "42");
}

TEST_F(SandboxTest, ExecuteCodeSpec) {
  auto spec = CodeSpec::builder()
                  .code("def process(inputs):\n    return inputs['x']\n")
                  .timeout(5s)
                  .build();
  ASSERT_TRUE(spec.has_value());
  auto result = sandbox_.execute(*spec, json(R"({"x":"y"})"));
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "\"y\"");
}

TEST(SandboxFailureTest, MissingCodeFile) {
  CodeSandbox sandbox;
  auto result = sandbox.execute_file("/nonexistent/evalflow/agg.py",
                                     Language::Python, json("{}"), 5s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::FileNotFound);
  EXPECT_EQ(result.error.value_or(""),
            "Code file not found: /nonexistent/evalflow/agg.py");
}

TEST(SandboxFailureTest, UnreadableCodeFile) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root ignores file permissions";
  }
  test::TempDir dir;
  auto path = dir.write("secret.py", "x = 1\n");
  ASSERT_EQ(::chmod(path.c_str(), 0), 0);
  CodeSandbox sandbox;
  auto result = sandbox.execute_file(path, Language::Python, json("{}"), 5s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::PermissionDenied);
  EXPECT_EQ(result.error.value_or(""),
            "Permission denied reading file: " + path.string());
}

TEST(SandboxFailureTest, InterpreterNotFound) {
  CodeSandbox sandbox(
      SandboxOptions{.python_executable = "/nonexistent/python3"});
  auto result = sandbox.execute(Language::Python, "x = 1", json("{}"), 5s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::InterpreterNotFound);
  EXPECT_EQ(result.error.value_or(""), "Python interpreter not found in PATH");
  EXPECT_EQ(result.stack_trace.value_or(""),
            "FileNotFoundError: 'python3' command not found in PATH");
}

TEST(SandboxFailureTest, NodeInterpreterNotFound) {
  CodeSandbox sandbox(SandboxOptions{.node_executable = "/nonexistent/node"});
  auto result =
      sandbox.execute(Language::Javascript, "1", json("{}"), 5s);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Node.js interpreter not found in PATH");
}

TEST(SandboxJavascriptTest, TransformReturnsJson) {
  if (!test::has_interpreter(Language::Javascript)) {
    GTEST_SKIP() << "node not available";
  }
  CodeSandbox sandbox;
  auto result = sandbox.execute(
      Language::Javascript,
      "function transform(inputs) { return { total: inputs.a * 10 }; }",
      json(R"({"a":4})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), R"({"total":40})");
}

TEST(SandboxJavascriptTest, ThrownErrorIsReported) {
  if (!test::has_interpreter(Language::Javascript)) {
    GTEST_SKIP() << "node not available";
  }
  CodeSandbox sandbox;
  auto result = sandbox.execute(
      Language::Javascript,
      "function main(inputs) { throw new Error('boom'); }", json("{}"), 10s);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.stack_trace.has_value());
  EXPECT_NE(result.stack_trace->find("boom"), std::string::npos);
}

TEST(SandboxJavascriptTest, ProcessEntryPointShadowsGlobal) {
  if (!test::has_interpreter(Language::Javascript)) {
    GTEST_SKIP() << "node not available";
  }
  CodeSandbox sandbox;
  auto result = sandbox.execute(
      Language::Javascript,
      "function process(inputs) { return { y: inputs.x + 1 }; }",
      json(R"({"x":1})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), R"({"y":2})");
}

TEST(SandboxJavascriptTest, ThrowingProcessEntryPointFails) {
  if (!test::has_interpreter(Language::Javascript)) {
    GTEST_SKIP() << "node not available";
  }
  CodeSandbox sandbox;
  auto result = sandbox.execute(
      Language::Javascript,
      "function process(inputs) { throw new Error('nope'); }", json("{}"),
      10s);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.exit_code, 0);
}

TEST(SandboxJavascriptTest, DefaultExportIsCalled) {
  if (!test::has_interpreter(Language::Javascript)) {
    GTEST_SKIP() << "node not available";
  }
  CodeSandbox sandbox;
  auto result = sandbox.execute(
      Language::Javascript,
      "module.exports = (inputs) => inputs.words.join(' ');",
      json(R"({"words":["a","b"]})"), 10s);
  ASSERT_TRUE(result.success) << result.describe();
  EXPECT_EQ(dump_json(result.output), "\"a b\"");

  auto nested = sandbox.execute(
      Language::Javascript,
      "module.exports = { default: async (inputs) => inputs.n * 3 };",
      json(R"({"n":5})"), 10s);
  ASSERT_TRUE(nested.success) << nested.describe();
  EXPECT_EQ(dump_json(nested.output), "15");
}

TEST(ExecutionResultTest, ToJsonIncludesCoreFields) {
  auto result =
      ExecutionResult::failed(FailureKind::Timeout, "Execution timed out");
  result.timed_out = true;
  auto doc = to_json(result);
  ASSERT_TRUE(doc.is_object());
  EXPECT_EQ(dump_json(*find_member(doc, "success")), "false");
  EXPECT_EQ(dump_json(*find_member(doc, "timed_out")), "true");
  EXPECT_EQ(stringify(*find_member(doc, "error")), "Execution timed out");
}
