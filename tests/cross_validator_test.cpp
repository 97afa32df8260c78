#include <scribe/confidence_scorer.h>
#include <scribe/cross_validator.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace scribe {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

CodeEntity Entity(const std::string &name, const std::string &file,
                  int line_start, int line_end) {
  return CodeEntity{name, "function", file, line_start, line_end, ""};
}

ChunkNarrative Narrative(const std::string &file, int start, int end,
                         const std::string &summary) {
  ChunkNarrative narrative;
  narrative.file_path = file;
  narrative.start_line = start;
  narrative.end_line = end;
  narrative.summary = summary;
  return narrative;
}

TEST(MentionedIdentifiersTest, KeepsIdentifierLikeSpans) {
  EXPECT_THAT(MentionedIdentifiers(
                  "Calls `Parser::run()` then `x.y` and `not an id` plus `"),
              ElementsAre("Parser::run()", "x.y"));
}

TEST(IdentifierWordsTest, SplitsCaseAndSeparators) {
  EXPECT_THAT(IdentifierWords("parseHttpRequest"),
              ElementsAre("parse", "http", "request"));
  EXPECT_THAT(IdentifierWords("parse_http_request"),
              ElementsAre("parse", "http", "request"));
  EXPECT_THAT(IdentifierWords("XMLParser"), ElementsAre("xml", "parser"));
  EXPECT_THAT(IdentifierWords("id_x"), IsEmpty());
}

class CrossValidateTest : public ::testing::Test {
protected:
  CrossValidateTest() {
    static_result_.ast_forest.entities = {
        Entity("Parser::parseConfig", "src/config.cpp", 1, 10),
        Entity("HttpClient", "src/http.cpp", 1, 20),
        Entity("loadUserProfile", "src/user.cpp", 5, 15),
        Entity("Orphan", "src/orphan.cpp", 1, 3)};
    llm_result_.narratives = {
        Narrative("src/config.cpp", 1, 10, "Reads `parseConfig()` input."),
        Narrative("src/other.cpp", 1, 5,
                  "Wraps `HttpClient` calls and schedules `retryLater`."),
        Narrative("src/user.cpp", 1, 20, "Loads the user profile from disk.")};
  }

  StaticAnalysisResult static_result_;
  LlmAnalysisResult llm_result_;
};

TEST_F(CrossValidateTest, ScoresEachFindingBySourceAgreement) {
  const auto result = CrossValidate(static_result_, llm_result_);

  ASSERT_EQ(5u, result.entities.size());
  EXPECT_DOUBLE_EQ(confidence::kCrossValidatedHigh,
                   result.entities[0].confidence.value);
  EXPECT_DOUBLE_EQ(confidence::kCrossValidatedLow,
                   result.entities[1].confidence.value);
  EXPECT_DOUBLE_EQ(confidence::kCrossValidatedMedium,
                   result.entities[2].confidence.value);
  EXPECT_DOUBLE_EQ(confidence::kAstOnly, result.entities[3].confidence.value);
  EXPECT_EQ(AnalysisSource::kAst, result.entities[3].confidence.source);

  EXPECT_EQ("retryLater", result.entities[4].name);
  EXPECT_EQ("behavior", result.entities[4].kind);
  EXPECT_EQ("src/other.cpp", result.entities[4].file_path);
  EXPECT_DOUBLE_EQ(confidence::kLlmOnly, result.entities[4].confidence.value);

  EXPECT_EQ(3, result.cross_validated_count);
  EXPECT_EQ(1, result.ast_only_count);
  EXPECT_EQ(1, result.llm_only_count);
}

TEST_F(CrossValidateTest, RecordsConflictWhenDescribedElsewhere) {
  const auto result = CrossValidate(static_result_, llm_result_);

  ASSERT_EQ(1u, result.conflicts.size());
  EXPECT_THAT(result.conflicts[0], HasSubstr("'HttpClient'"));
  EXPECT_THAT(result.conflicts[0], HasSubstr("src/other.cpp"));
}

TEST(CrossValidateEmptyTest, WithoutNarrativesEverythingIsAstOnly) {
  StaticAnalysisResult static_result;
  static_result.ast_forest.entities = {Entity("run", "main.cpp", 1, 4)};

  const auto result = CrossValidate(static_result, LlmAnalysisResult{});

  ASSERT_EQ(1u, result.entities.size());
  EXPECT_EQ(1, result.ast_only_count);
  EXPECT_THAT(result.conflicts, IsEmpty());
}

} // namespace
} // namespace scribe
