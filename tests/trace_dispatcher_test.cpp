#include <scribe/trace_dispatcher.h>
#include <scribe/trace_handlers.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace scribe {
namespace {

using ::testing::HasSubstr;

class RecordingHandler : public TraceHandler {
public:
  explicit RecordingHandler(std::string name) : name_(std::move(name)) {}
  std::string Name() const override { return name_; }
  void Handle(const TraceEvent &event) override { events.push_back(event); }

  std::vector<TraceEvent> events;

private:
  std::string name_;
};

class FailingHandler : public TraceHandler {
public:
  std::string Name() const override { return "failing"; }
  void Handle(const TraceEvent &) override {
    throw std::runtime_error("sink offline");
  }
};

TEST(TraceDispatcherTest, RegisteringSameNameTwiceKeepsOneHandler) {
  TraceDispatcher dispatcher;

  EXPECT_TRUE(dispatcher.Register(std::make_shared<RecordingHandler>("sink")));
  EXPECT_FALSE(dispatcher.Register(std::make_shared<RecordingHandler>("sink")));
  EXPECT_FALSE(dispatcher.Register(nullptr));

  EXPECT_EQ(1u, dispatcher.HandlerCount());
}

TEST(TraceDispatcherTest, FailingHandlerDoesNotStopOthers) {
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kWarn}, log);
  TraceDispatcher dispatcher(logger);
  auto before = std::make_shared<RecordingHandler>("before");
  auto after = std::make_shared<RecordingHandler>("after");
  dispatcher.Register(before);
  dispatcher.Register(std::make_shared<FailingHandler>());
  dispatcher.Register(after);

  EXPECT_NO_THROW(EmitStageStart(dispatcher, "run:demo", "quality"));

  EXPECT_EQ(1u, before->events.size());
  ASSERT_EQ(1u, after->events.size());
  EXPECT_EQ(TraceEventType::kStageStart, after->events[0].type);
  EXPECT_THAT(log.str(), HasSubstr("trace.handler.error"));
  EXPECT_THAT(log.str(), HasSubstr("\"handler\": \"failing\""));
  EXPECT_THAT(log.str(), HasSubstr("\"error\": \"sink offline\""));
}

TEST(TraceDispatcherTest, StageEndCarriesOutcome) {
  TraceDispatcher dispatcher;
  auto recorder = std::make_shared<RecordingHandler>("recorder");
  dispatcher.Register(recorder);

  EmitStageEnd(dispatcher, "run:demo", "static_analysis", 12.5, false,
               std::string("parse failed"));
  EmitStageEnd(dispatcher, "run:demo", "quality", 1.0, true, std::nullopt);

  ASSERT_EQ(2u, recorder->events.size());
  const auto &failed = recorder->events[0];
  EXPECT_EQ("run:demo", failed.trace_id);
  EXPECT_EQ(TraceCategory::kAnalysis, failed.category);
  EXPECT_EQ("parse failed", FormatTraceValue(failed.data.at("error")));
  EXPECT_EQ("false", FormatTraceValue(failed.data.at("ok")));
  EXPECT_EQ("null", FormatTraceValue(recorder->events[1].data.at("error")));
}

TEST(TraceEventsTest, FormatsTimestampsInUtcWithMilliseconds) {
  const std::chrono::system_clock::time_point epoch_plus{
      std::chrono::milliseconds(1500)};

  EXPECT_EQ("1970-01-01T00:00:01.500Z", FormatTimestamp(epoch_plus));
}

TEST(CostAggregatorHandlerTest, SumsLlmCallsPerTrace) {
  TraceDispatcher dispatcher;
  auto costs = std::make_shared<CostAggregatorHandler>();
  dispatcher.Register(costs);

  EmitLlmCall(dispatcher, "run:a", "fast", 100, 20, 5.0, 0.01);
  EmitLlmCall(dispatcher, "run:a", "fast", 50, 10, 5.0, 0.02);
  EmitLlmCall(dispatcher, "run:b", "slow", 7, 3, 5.0, 0.5);
  EmitStageStart(dispatcher, "run:a", "llm_analysis");

  const auto a = costs->CostFor("run:a");
  EXPECT_EQ(150, a.input_tokens);
  EXPECT_EQ(30, a.output_tokens);
  EXPECT_DOUBLE_EQ(0.03, a.total_cost);
  EXPECT_EQ(2, a.call_count);
  EXPECT_EQ(2u, costs->AllCosts().size());

  costs->Clear();
  EXPECT_EQ(0, costs->CostFor("run:a").call_count);
}

TEST(ConsoleTraceHandlerTest, LogsEventWithDataFields) {
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kInfo}, log);
  ConsoleTraceHandler handler(logger);

  handler.Handle(MakeTraceEvent(TraceEventType::kPipelineStart, "run:demo",
                                TraceCategory::kPipeline,
                                {{"project_id", std::string("demo")}}));

  EXPECT_THAT(log.str(), HasSubstr("message=\"trace\""));
  EXPECT_THAT(log.str(), HasSubstr("\"trace_type\": \"pipeline_start\""));
  EXPECT_THAT(log.str(), HasSubstr("\"project_id\": \"demo\""));
}

TEST(ConsoleTraceHandlerTest, SilentBelowItsLevel) {
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kInfo}, log);
  ConsoleTraceHandler handler(logger, LogLevel::kDebug);

  handler.Handle(MakeTraceEvent(TraceEventType::kPipelineEnd, "run:demo",
                                TraceCategory::kPipeline));

  EXPECT_TRUE(log.str().empty());
}

} // namespace
} // namespace scribe
