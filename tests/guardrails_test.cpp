#include <scribe/guardrails.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include "test_support/temporary_project.h"

namespace scribe {
namespace {

using ::testing::HasSubstr;
using ::testing::Return;

class MockSourceReader : public SourceReader {
public:
  MOCK_METHOD(bool, FileExists, (const std::string &path), (const, override));
  MOCK_METHOD(std::optional<std::size_t>, CountLines, (const std::string &path),
              (const, override));
};

Citation Cite(const std::string &path, int line_start, int line_end) {
  Citation citation;
  citation.file_path = path;
  citation.line_start = line_start;
  citation.line_end = line_end;
  return citation;
}

class GuardrailsTest : public ::testing::Test {
protected:
  GuardrailsTest() {
    project_.AddFile("src/two_lines.cpp", "int a;\nint b;\n");
  }

  GuardrailEvaluator Evaluator() const {
    return GuardrailEvaluator(
        std::make_shared<FilesystemSourceReader>(project_.root()));
  }

  test::TemporaryProject project_{"scribe-guardrails"};
};

TEST_F(GuardrailsTest, CitationPastEndOfFileFails) {
  const auto result =
      Evaluator().VerifyCitation(Cite("src/two_lines.cpp", 1, 100));

  EXPECT_FALSE(result.passed);
  EXPECT_EQ("citation_line_end", result.check_name);
  ASSERT_TRUE(result.reason.has_value());
  EXPECT_THAT(*result.reason, HasSubstr("exceeds"));
  EXPECT_THAT(*result.reason, HasSubstr("(2)"));
}

TEST_F(GuardrailsTest, LineStartZeroFails) {
  const auto result =
      Evaluator().VerifyCitation(Cite("src/two_lines.cpp", 0, 1));

  EXPECT_FALSE(result.passed);
  EXPECT_EQ("citation_line_start", result.check_name);
}

TEST_F(GuardrailsTest, CitationWithinBoundsPasses) {
  const auto result =
      Evaluator().VerifyCitation(Cite("src/two_lines.cpp", 1, 2));

  EXPECT_TRUE(result.passed);
  EXPECT_EQ("citation_valid", result.check_name);
  EXPECT_FALSE(result.reason.has_value());
}

TEST_F(GuardrailsTest, MissingAndEscapingPathsFail) {
  const auto evaluator = Evaluator();

  EXPECT_EQ("citation_file_exists",
            evaluator.VerifyCitation(Cite("src/missing.cpp", 1, 1)).check_name);
  EXPECT_EQ("citation_file_exists",
            evaluator.VerifyCitation(Cite("../outside.cpp", 1, 1)).check_name);
}

TEST_F(GuardrailsTest, ReversedRangeFails) {
  const auto result =
      Evaluator().VerifyCitation(Cite("src/two_lines.cpp", 2, 1));

  EXPECT_EQ("citation_line_range", result.check_name);
  EXPECT_THAT(*result.reason, HasSubstr("src/two_lines.cpp:2-1"));
}

TEST(GuardrailEvaluatorTest, UnreadableFileIsReported) {
  auto reader = std::make_shared<MockSourceReader>();
  EXPECT_CALL(*reader, FileExists("locked.cpp")).WillOnce(Return(true));
  EXPECT_CALL(*reader, CountLines("locked.cpp"))
      .WillOnce(Return(std::nullopt));
  const GuardrailEvaluator evaluator(reader);

  const auto result = evaluator.VerifyCitation(Cite("locked.cpp", 1, 1));

  EXPECT_EQ("citation_file_readable", result.check_name);
  EXPECT_EQ("Cannot read file: locked.cpp", result.reason.value_or(""));
}

TEST(GuardrailEvaluatorTest, VerifiesEveryCitation) {
  auto reader = std::make_shared<MockSourceReader>();
  EXPECT_CALL(*reader, FileExists(::testing::_)).WillRepeatedly(Return(true));
  EXPECT_CALL(*reader, CountLines(::testing::_))
      .WillRepeatedly(Return(std::optional<std::size_t>(10)));
  const GuardrailEvaluator evaluator(reader);

  const auto results = evaluator.VerifyCitations(
      {Cite("a.cpp", 1, 5), Cite("b.cpp", 3, 11), Cite("c.cpp", 10, 10)});

  ASSERT_EQ(3u, results.size());
  EXPECT_TRUE(results[0].passed);
  EXPECT_FALSE(results[1].passed);
  EXPECT_TRUE(results[2].passed);
}

TEST(GuardrailEvaluatorTest, RequiresReader) {
  EXPECT_THROW(GuardrailEvaluator(nullptr), std::invalid_argument);
}

TEST(GuardrailEvaluatorTest, ValidatesAndTruncatesInput) {
  std::stringstream log;
  GuardrailConfig config;
  config.max_input_length = 5;
  const GuardrailEvaluator evaluator(
      std::make_shared<FilesystemSourceReader>("."), config,
      MakeLogger({LogLevel::kWarn}, log));

  EXPECT_EQ("abc", evaluator.ValidateInput("  abc \n"));
  EXPECT_EQ("abcde", evaluator.ValidateInput("abcdefgh"));
  EXPECT_THAT(log.str(), HasSubstr("guardrail.input.truncated"));
  EXPECT_THROW(evaluator.ValidateInput(" \t\n"), std::invalid_argument);
}

TEST(GuardrailEvaluatorTest, GatesContentBelowThreshold) {
  const GuardrailEvaluator evaluator(
      std::make_shared<FilesystemSourceReader>("."));

  const auto gated = evaluator.GateLowConfidence("Body", 0.456);
  const auto at_threshold = evaluator.GateLowConfidence("Body", 0.60);

  EXPECT_TRUE(gated.gated);
  EXPECT_EQ("[Low confidence: 0.46] Body", gated.content);
  EXPECT_FALSE(at_threshold.gated);
  EXPECT_EQ("Body", at_threshold.content);
}

} // namespace
} // namespace scribe
