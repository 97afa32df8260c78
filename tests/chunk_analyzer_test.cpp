#include <scribe/chunk_analyzer.h>
#include <scribe/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scribe {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class MockModelClient : public ModelClient {
public:
  MOCK_METHOD(ModelResponse, Call,
              (const std::string &model,
               const std::vector<ChatMessage> &messages,
               std::chrono::seconds timeout, ResponseMode mode),
              (override));
};

ModelResponse Reply(const std::string &content) {
  ModelResponse response;
  response.content = content;
  return response;
}

CodeChunk Chunk(const std::string &path, const std::string &language,
                const std::string &content) {
  CodeChunk chunk;
  chunk.file_path = path;
  chunk.language = language;
  chunk.start_line = 1;
  chunk.end_line = 3;
  chunk.content = content;
  return chunk;
}

class ModelChunkAnalyzerTest : public ::testing::Test {
protected:
  std::shared_ptr<ResilientCaller> MakeCaller() {
    RetryPolicy retry;
    retry.max_attempts = 1;
    return std::make_shared<ResilientCaller>(
        client_, retry, BreakerPolicy{}, nullptr, nullptr,
        [](std::chrono::milliseconds) {});
  }

  ChunkedFiles Chunks() const {
    ChunkedFiles chunks;
    chunks.chunks = {Chunk("src/a.cpp", "cpp", "int a();"),
                     Chunk("README.md", "markdown", "# readme"),
                     Chunk("src/b.cpp", "cpp", "int b();")};
    chunks.total_files = 3;
    return chunks;
  }

  std::shared_ptr<MockModelClient> client_ =
      std::make_shared<MockModelClient>();
  std::shared_ptr<InMemoryCheckpointStore> checkpoints_ =
      std::make_shared<InMemoryCheckpointStore>();
};

TEST(ParseNarrativeTest, SplitsSummaryAndBehaviors) {
  const auto narrative =
      ParseNarrative(Chunk("x.cpp", "cpp", ""),
                     "\n  Parses `Config` files.  \n- reads yaml\n* validates "
                     "keys\nextra prose\n-   \n");

  EXPECT_EQ("Parses `Config` files.", narrative.summary);
  EXPECT_THAT(narrative.behaviors, ElementsAre("reads yaml", "validates keys"));
  EXPECT_EQ("x.cpp", narrative.file_path);
}

TEST(NarrativeCodecTest, DecodeRejectsTruncatedPayload) {
  EXPECT_FALSE(DecodeNarrative("only\ttwo").has_value());
  EXPECT_FALSE(DecodeNarrative("a\tnot-a-number\t3\tsummary").has_value());
}

TEST(NarrativeCodecTest, KeepsBehaviorsWithTabs) {
  ChunkNarrative narrative;
  narrative.file_path = "src/a.cpp";
  narrative.start_line = 4;
  narrative.end_line = 9;
  narrative.summary = "Loads\tthings";
  narrative.behaviors = {"first", "second"};

  const auto decoded = DecodeNarrative(EncodeNarrative(narrative));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ("Loads\tthings", decoded->summary);
  EXPECT_EQ(9, decoded->end_line);
  EXPECT_THAT(decoded->behaviors, ElementsAre("first", "second"));
}

TEST_F(ModelChunkAnalyzerTest, AnalyzesCodeChunksAndReportsProgress) {
  EXPECT_CALL(*client_, Call("primary", _, _, _))
      .Times(2)
      .WillRepeatedly(Return(Reply("Declares a function.\n- returns int")));
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_);
  std::vector<StageEvent> ticks;
  ChunkAnalysisContext context;
  context.project_id = "demo";
  context.on_progress = [&](const StageEvent &event) {
    ticks.push_back(event);
  };

  const auto result = analyzer.Analyze(Chunks(), context);

  EXPECT_EQ(2, result.analyzed_chunks);
  ASSERT_EQ(2u, result.narratives.size());
  EXPECT_EQ("Declares a function.", result.narratives[0].summary);
  EXPECT_EQ(2u, checkpoints_->Count("demo"));
  ASSERT_EQ(2u, ticks.size());
  EXPECT_EQ("Analyzed 1/2 chunks", ticks[0].message);
  EXPECT_EQ(50.0, ticks[0].percent.value_or(0));
  EXPECT_EQ(100.0, ticks[1].percent.value_or(0));
}

TEST_F(ModelChunkAnalyzerTest, ResumesFromCheckpoints) {
  const auto chunks = Chunks();
  ChunkNarrative cached;
  cached.file_path = "src/a.cpp";
  cached.summary = "From an earlier run.";
  checkpoints_->Put("demo", ChunkContentHash(chunks.chunks[0]),
                    EncodeNarrative(cached));
  EXPECT_CALL(*client_, Call(_, _, _, _))
      .WillOnce(Return(Reply("Declares b.")));
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_);
  ChunkAnalysisContext context;
  context.project_id = "demo";

  const auto result = analyzer.Analyze(chunks, context);

  EXPECT_EQ(1, result.resumed_chunks);
  EXPECT_EQ(1, result.analyzed_chunks);
  ASSERT_EQ(2u, result.narratives.size());
  EXPECT_EQ("From an earlier run.", result.narratives[0].summary);
}

TEST_F(ModelChunkAnalyzerTest, CountsChunksNoModelCouldDescribe) {
  EXPECT_CALL(*client_, Call(_, _, _, _))
      .WillRepeatedly(Throw(ModelCallError("boom", 500)));
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_);

  const auto result = analyzer.Analyze(Chunks(), ChunkAnalysisContext{});

  EXPECT_EQ(2, result.failed_chunks);
  EXPECT_TRUE(result.narratives.empty());
  EXPECT_EQ(0u, checkpoints_->Count(""));
}

TEST_F(ModelChunkAnalyzerTest, StopsWhenCancelled) {
  EXPECT_CALL(*client_, Call(_, _, _, _)).Times(0);
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_);
  CancellationToken token;
  token.Cancel();
  ChunkAnalysisContext context;
  context.cancellation = &token;

  EXPECT_THROW(analyzer.Analyze(Chunks(), context), CancelledError);
}

TEST_F(ModelChunkAnalyzerTest, RepeatedContentAtOtherLinesIsAnalyzedAgain) {
  EXPECT_CALL(*client_, Call(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Return(Reply("Returns zero.")));
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_);
  ChunkedFiles chunks;
  chunks.chunks = {Chunk("src/a.cpp", "cpp", "return 0;"),
                   Chunk("src/a.cpp", "cpp", "return 0;")};
  chunks.chunks[1].start_line = 4;
  chunks.chunks[1].end_line = 6;
  ChunkAnalysisContext context;
  context.project_id = "demo";

  const auto result = analyzer.Analyze(chunks, context);

  EXPECT_EQ(2, result.analyzed_chunks);
  EXPECT_EQ(0, result.resumed_chunks);
  ASSERT_EQ(2u, result.narratives.size());
  EXPECT_EQ(1, result.narratives[0].start_line);
  EXPECT_EQ(4, result.narratives[1].start_line);
}

class FailingWriteStore : public InMemoryCheckpointStore {
public:
  void Put(const std::string &, const std::string &,
           const std::string &) override {
    throw std::runtime_error("disk full");
  }
};

TEST_F(ModelChunkAnalyzerTest, CheckpointWriteFailureKeepsNarratives) {
  EXPECT_CALL(*client_, Call(_, _, _, _))
      .WillRepeatedly(Return(Reply("Declares a function.")));
  std::ostringstream log;
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"},
                              std::make_shared<FailingWriteStore>(),
                              ChunkAnalysisOptions{},
                              MakeLogger({LogLevel::kWarn}, log));

  const auto result = analyzer.Analyze(Chunks(), ChunkAnalysisContext{});

  EXPECT_EQ(2, result.analyzed_chunks);
  EXPECT_EQ(2u, result.narratives.size());
  EXPECT_THAT(log.str(), HasSubstr("checkpoint.write.failed"));
  EXPECT_THAT(log.str(), HasSubstr("disk full"));
}

// Sleeps inside every call and records how many calls overlapped.
class SlowModelClient : public ModelClient {
public:
  ModelResponse Call(const std::string &, const std::vector<ChatMessage> &,
                     std::chrono::seconds, ResponseMode) override {
    const auto now = ++in_flight_;
    auto peak = peak_.load();
    while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    --in_flight_;
    return Reply("Slow but described.");
  }

  int Peak() const { return peak_.load(); }

private:
  std::atomic<int> in_flight_{0};
  std::atomic<int> peak_{0};
};

TEST(ModelChunkAnalyzerConcurrencyTest, DescribesChunksUpToTheLimitAtOnce) {
  auto client = std::make_shared<SlowModelClient>();
  RetryPolicy retry;
  retry.max_attempts = 1;
  auto caller = std::make_shared<ResilientCaller>(
      client, retry, BreakerPolicy{}, nullptr, nullptr,
      [](std::chrono::milliseconds) {});
  ChunkAnalysisOptions options;
  options.max_concurrency = 2;
  ModelChunkAnalyzer analyzer(caller, {"primary"}, nullptr, options);
  ChunkedFiles chunks;
  for (int i = 0; i < 6; ++i) {
    chunks.chunks.push_back(
        Chunk("src/f" + std::to_string(i) + ".cpp", "cpp", "int f();"));
  }
  std::vector<int> completed;
  ChunkAnalysisContext context;
  context.on_progress = [&](const StageEvent &tick) {
    completed.push_back(tick.completed.value_or(0));
  };

  const auto result = analyzer.Analyze(chunks, context);

  EXPECT_EQ(6, result.analyzed_chunks);
  EXPECT_EQ(2, client->Peak());
  EXPECT_THAT(completed, ElementsAre(1, 2, 3, 4, 5, 6));
  ASSERT_EQ(6u, result.narratives.size());
  EXPECT_EQ("src/f0.cpp", result.narratives.front().file_path);
  EXPECT_EQ("src/f5.cpp", result.narratives.back().file_path);
}

TEST_F(ModelChunkAnalyzerTest, ExpiredDeadlineLeavesChunksUnstarted) {
  EXPECT_CALL(*client_, Call(_, _, _, _)).Times(0);
  ChunkAnalysisOptions options;
  options.analysis_timeout = std::chrono::milliseconds(0);
  std::ostringstream log;
  ModelChunkAnalyzer analyzer(MakeCaller(), {"primary"}, checkpoints_,
                              options, MakeLogger({LogLevel::kWarn}, log));

  const auto result = analyzer.Analyze(Chunks(), ChunkAnalysisContext{});

  EXPECT_TRUE(result.narratives.empty());
  EXPECT_EQ(0, result.analyzed_chunks);
  EXPECT_THAT(log.str(), HasSubstr("llm.analysis.timeout"));
}

TEST(ModelChunkAnalyzerDisabledTest, ReturnsEmptyWithoutModelChain) {
  std::ostringstream log;
  ModelChunkAnalyzer analyzer(nullptr, {}, nullptr, ChunkAnalysisOptions{},
                              MakeLogger({LogLevel::kInfo}, log));

  const auto result = analyzer.Analyze(ChunkedFiles{}, ChunkAnalysisContext{});

  EXPECT_TRUE(result.narratives.empty());
  EXPECT_THAT(log.str(), HasSubstr("llm.analysis.disabled"));
}

} // namespace
} // namespace scribe
