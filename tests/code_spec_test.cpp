#include "evalflow/sandbox/code_spec.hpp"

#include "gtest/gtest.h"

using namespace evalflow;

TEST(CodeSpecTest, InlineCodeBuilds) {
  auto spec = CodeSpec::builder()
                  .language(Language::Python)
                  .code("def transform(inputs):\n    return inputs\n")
                  .timeout(std::chrono::seconds(5))
                  .build();
  ASSERT_TRUE(spec.has_value());
  EXPECT_TRUE(spec->is_inline());
  EXPECT_FALSE(spec->code_file.has_value());
  EXPECT_EQ(spec->timeout, std::chrono::seconds(5));
}

TEST(CodeSpecTest, FileOnlyBuilds) {
  auto spec = CodeSpec::builder()
                  .language("js")
                  .code_file("/tmp/agg.js")
                  .build();
  ASSERT_TRUE(spec.has_value());
  EXPECT_FALSE(spec->is_inline());
  EXPECT_EQ(spec->language, Language::Javascript);
  EXPECT_EQ(spec->code_file->string(), "/tmp/agg.js");
}

TEST(CodeSpecTest, BothCodeAndFileRejected) {
  auto spec =
      CodeSpec::builder().code("x = 1").code_file("/tmp/agg.py").build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidCodeSpec));
}

TEST(CodeSpecTest, EmptyCodeWithFileStillCountsAsBoth) {
  auto spec = CodeSpec::builder().code("").code_file("/tmp/agg.py").build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidCodeSpec));

  auto reversed = CodeSpec::builder().code("x = 1").code_file("").build();
  ASSERT_FALSE(reversed.has_value());
  EXPECT_EQ(reversed.error(), make_error_code(Error::InvalidCodeSpec));
}

TEST(CodeSpecTest, NeitherCodeNorFileRejected) {
  auto spec = CodeSpec::builder().language(Language::Python).build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidCodeSpec));
}

TEST(CodeSpecTest, EmptyCodeCountsAsAbsent) {
  auto spec = CodeSpec::builder().code("").build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidCodeSpec));
}

TEST(CodeSpecTest, NonPositiveTimeoutRejected) {
  auto spec = CodeSpec::builder()
                  .code("x = 1")
                  .timeout(std::chrono::seconds(0))
                  .build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidArgument));
}

TEST(CodeSpecTest, InvalidEnvKeyRejected) {
  auto spec = CodeSpec::builder().code("x = 1").env("BAD-KEY", "1").build();
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidArgument));
}

TEST(CodeSpecTest, UnknownLanguageRejected) {
  auto spec = CodeSpec::builder().language("ruby").code("x = 1").build();
  ASSERT_FALSE(spec.has_value());
}

TEST(CodeSpecTest, LanguageAliases) {
  EXPECT_EQ(parse_language("Python").value(), Language::Python);
  EXPECT_EQ(parse_language("py").value(), Language::Python);
  EXPECT_EQ(parse_language("node").value(), Language::Javascript);
  EXPECT_EQ(parse_language("JavaScript").value(), Language::Javascript);
  EXPECT_FALSE(parse_language("cobol").has_value());
}

TEST(CodeSpecTest, DisplayNamesAndExtensions) {
  EXPECT_EQ(language_display_name(Language::Python), "Python");
  EXPECT_EQ(language_display_name(Language::Javascript), "Node.js");
  EXPECT_EQ(source_file_extension(Language::Python), ".py");
  EXPECT_EQ(source_file_extension(Language::Javascript), ".js");
}
