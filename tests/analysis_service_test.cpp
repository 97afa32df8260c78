#include <scribe/analysis_service.h>
#include <scribe/errors.h>
#include <scribe/local_source_resolver.h>
#include <scribe/static_extractors.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scribe {
namespace {

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// Resolves the real tree, optionally holding the run inside the first stage
// until the test releases it.
class GatedResolver : public SourceResolver {
public:
  struct Gate {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> calls{0};
    bool enabled = false;
  };

  explicit GatedResolver(std::shared_ptr<Gate> gate) : gate_(std::move(gate)) {}

  SourceTree Resolve(const std::string &repo_path,
                     const std::string &branch) override {
    if (gate_->calls.fetch_add(1) == 0 && gate_->enabled) {
      gate_->entered.set_value();
      gate_->released.wait();
    }
    return LocalSourceResolver().Resolve(repo_path, branch);
  }

private:
  std::shared_ptr<Gate> gate_;
};

class FakeParser : public AstParser {
public:
  AstForest Parse(const SourceTree &, const LanguageMap &) override {
    AstForest forest;
    forest.entities = {{"main", "function", "src/main.cpp", 1, 2, "int main()"}};
    forest.parsed_files = 1;
    return forest;
  }
};

class BrokenSectionGenerator : public SectionGenerator {
public:
  std::vector<std::string> SupportedSections() const override {
    throw std::runtime_error("section catalog unavailable");
  }
  SectionOutput Generate(const std::string &, const IntelligenceModel &) override {
    return {};
  }
};

std::vector<StreamEnvelope> Drain(EventStream &stream) {
  std::vector<StreamEnvelope> envelopes;
  while (auto envelope = stream.Next()) {
    envelopes.push_back(std::move(*envelope));
  }
  return envelopes;
}

class AnalysisServiceTest : public ::testing::Test {
protected:
  AnalysisServiceTest() {
    project_.AddFile("src/main.cpp", "int main() {\n}\n");
    project_.AddFile("README.md", "# demo\n");
  }

  std::unique_ptr<AnalysisService> MakeService(bool broken_sections = false) {
    StaticAnalyzerComponents components;
    components.parser = std::make_unique<FakeParser>();
    components.call_graph = std::make_unique<AstCallGraphBuilder>();
    components.dependencies = std::make_unique<SourceDependencyExtractor>();
    components.schemas = std::make_unique<AstSchemaExtractor>();
    components.endpoints = std::make_unique<RouteEndpointDiscoverer>();

    PipelineRunnerBuilder builder;
    builder.WithResolver(std::make_unique<GatedResolver>(gate_))
        .WithStaticAnalyzer(
            std::make_unique<StaticAnalyzer>(std::move(components)));
    if (broken_sections) {
      builder.WithSectionGenerator(std::make_unique<BrokenSectionGenerator>());
    }
    std::shared_ptr<const PipelineRunner> runner = builder.Build();
    return std::make_unique<AnalysisService>(runner);
  }

  std::string Root() const { return project_.root().string(); }

  static void WaitUntilIdle(const AnalysisService &service,
                            const std::string &project_id) {
    for (int i = 0; i < 200 && service.IsRunning(project_id); ++i) {
      std::this_thread::sleep_for(10ms);
    }
  }

  test::TemporaryProject project_;
  std::shared_ptr<GatedResolver::Gate> gate_ =
      std::make_shared<GatedResolver::Gate>();
};

TEST(AnalysisKeyTest, PrefixesProjectId) {
  EXPECT_EQ("analyze:demo", AnalysisKey("demo"));
}

TEST_F(AnalysisServiceTest, StreamsStagesThenComplete) {
  auto service = MakeService();

  auto stream = service->Start("demo", Root());
  const auto envelopes = Drain(*stream);

  ASSERT_GE(envelopes.size(), 2u);
  EXPECT_EQ(StreamEventKind::kStage, envelopes.front().kind);
  ASSERT_TRUE(envelopes.front().stage.has_value());
  EXPECT_EQ("ingestion_resolve", envelopes.front().stage->name);
  EXPECT_EQ(StreamEventKind::kComplete, envelopes.back().kind);
  EXPECT_THAT(envelopes.back().data, HasSubstr("\"project_id\": \"demo\""));

  const auto result = service->Wait("demo");
  EXPECT_EQ("demo", result.project_id);
  EXPECT_FALSE(result.aborted);
}

TEST_F(AnalysisServiceTest, StatusReportsLatestStateOfEachStage) {
  auto service = MakeService();
  Drain(*service->Start("demo", Root()));

  const auto stages = service->Status("demo");

  ASSERT_FALSE(stages.empty());
  EXPECT_EQ("ingestion_resolve", stages.front().name);
  EXPECT_EQ("Scanning codebase", stages.front().label);
  for (const auto &stage : stages) {
    EXPECT_NE(StageProgress::kRunning, stage.status) << stage.name;
  }
}

TEST_F(AnalysisServiceTest, SecondCallerJoinsRunningAnalysis) {
  gate_->enabled = true;
  auto service = MakeService();
  auto entered = gate_->entered.get_future();

  auto primary = service->Start("demo", Root());
  entered.wait();
  auto joined = service->Start("demo", Root());
  EXPECT_TRUE(service->IsRunning("demo"));
  gate_->release.set_value();

  const auto primary_envelopes = Drain(*primary);
  const auto joined_envelopes = Drain(*joined);

  EXPECT_EQ(1, gate_->calls.load());
  ASSERT_FALSE(joined_envelopes.empty());
  EXPECT_EQ(primary_envelopes.size(), joined_envelopes.size());
  EXPECT_EQ(StreamEventKind::kComplete, joined_envelopes.back().kind);
  EXPECT_EQ(primary_envelopes.back().data, joined_envelopes.back().data);
}

TEST_F(AnalysisServiceTest, PauseEndsStreamAndCancelsRun) {
  gate_->enabled = true;
  auto service = MakeService();
  auto entered = gate_->entered.get_future();

  auto primary = service->Start("demo", Root());
  entered.wait();
  EXPECT_TRUE(service->Pause("demo"));
  gate_->release.set_value();

  const auto envelopes = Drain(*primary);

  ASSERT_FALSE(envelopes.empty());
  EXPECT_EQ(StreamEventKind::kPaused, envelopes.back().kind);
  EXPECT_THROW(service->Wait("demo"), CancelledError);
}

TEST_F(AnalysisServiceTest, StartAfterCompletionRunsAgain) {
  auto service = MakeService();
  Drain(*service->Start("demo", Root()));
  service->Wait("demo");
  WaitUntilIdle(*service, "demo");

  const auto second = Drain(*service->Start("demo", Root()));

  EXPECT_EQ(2, gate_->calls.load());
  ASSERT_FALSE(second.empty());
  EXPECT_EQ(StreamEventKind::kComplete, second.back().kind);
}

TEST_F(AnalysisServiceTest, RestartAfterPauseDoesNotBlockOtherProjects) {
  gate_->enabled = true;
  auto service = MakeService();
  auto entered = gate_->entered.get_future();

  auto paused = service->Start("alpha", Root());
  entered.wait();
  ASSERT_TRUE(service->Pause("alpha"));
  // The paused worker stays inside the resolver until the gate opens.
  auto restarted = service->Start("alpha", Root());

  const auto other = Drain(*service->Start("beta", Root()));

  ASSERT_FALSE(other.empty());
  EXPECT_EQ(StreamEventKind::kComplete, other.back().kind);
  EXPECT_TRUE(service->IsRunning("alpha"));

  gate_->release.set_value();
  EXPECT_EQ(StreamEventKind::kPaused, Drain(*paused).back().kind);
  const auto resumed = Drain(*restarted);
  ASSERT_FALSE(resumed.empty());
  EXPECT_EQ(StreamEventKind::kComplete, resumed.back().kind);
  EXPECT_EQ("alpha", service->Wait("alpha").project_id);
}

TEST_F(AnalysisServiceTest, FinishedRunReleasesChannelButKeepsStatus) {
  auto service = MakeService();
  Drain(*service->Start("demo", Root()));
  service->Wait("demo");
  WaitUntilIdle(*service, "demo");

  EXPECT_FALSE(service->Channel().HasChannel(AnalysisKey("demo")));
  const auto stages = service->Status("demo");
  ASSERT_FALSE(stages.empty());
  EXPECT_EQ("ingestion_resolve", stages.front().name);
}

TEST_F(AnalysisServiceTest, FailedRunStreamsGenericError) {
  auto service = MakeService(true);

  const auto envelopes = Drain(*service->Start("demo", Root()));

  ASSERT_FALSE(envelopes.empty());
  EXPECT_EQ(StreamEventKind::kError, envelopes.back().kind);
  EXPECT_THAT(envelopes.back().data,
              HasSubstr("Analysis failed. Check server logs for details."));
  EXPECT_THAT(envelopes.back().data,
              ::testing::Not(HasSubstr("section catalog unavailable")));
  EXPECT_THROW(service->Wait("demo"), std::runtime_error);
}

TEST_F(AnalysisServiceTest, UnknownProjects) {
  auto service = MakeService();

  EXPECT_FALSE(service->Pause("ghost"));
  EXPECT_FALSE(service->IsRunning("ghost"));
  EXPECT_THAT(service->Status("ghost"), IsEmpty());
  EXPECT_THROW(service->Wait("ghost"), std::invalid_argument);
  EXPECT_THROW(service->Start("", Root()), std::invalid_argument);
}

TEST(AnalysisServiceConstructionTest, RequiresRunner) {
  EXPECT_THROW(AnalysisService(nullptr), std::invalid_argument);
}

} // namespace
} // namespace scribe
