#include <scribe/errors.h>
#include <scribe/resilient_caller.h>
#include <scribe/trace_handlers.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <vector>

namespace scribe {
namespace {

using ::testing::_;
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

ModelResponse Answer(const std::string &content) {
  ModelResponse response;
  response.content = content;
  response.input_tokens = 10;
  response.output_tokens = 5;
  response.cost = 0.25;
  return response;
}

class ResilientCallerTest : public ::testing::Test {
protected:
  ResilientCallerTest() {
    retry_.max_attempts = 3;
    retry_.initial_wait = std::chrono::milliseconds(100);
    retry_.max_wait = std::chrono::milliseconds(1000);
    breaker_.failure_threshold = 2;
  }

  ResilientCaller MakeCaller() {
    return ResilientCaller(
        client_, retry_, breaker_, MakeLogger({LogLevel::kDebug}, log_),
        nullptr, [this](std::chrono::milliseconds wait) {
          waits_.push_back(wait);
        });
  }

  std::shared_ptr<MockModelClient> client_ =
      std::make_shared<MockModelClient>();
  RetryPolicy retry_;
  BreakerPolicy breaker_;
  std::stringstream log_;
  std::vector<std::chrono::milliseconds> waits_;
};

TEST_F(ResilientCallerTest, RetriesRateLimitedCallsWithBackoff) {
  EXPECT_CALL(*client_, Call("fast", _, _, _))
      .WillOnce(Throw(ModelCallError("slow down", 429)))
      .WillOnce(Throw(ModelCallError("slow down", 429)))
      .WillOnce(Return(Answer("done")));
  auto caller = MakeCaller();

  const auto result = caller.GuardedCall("fast", ModelRequest{});

  EXPECT_EQ("done", result.content);
  EXPECT_EQ("fast", result.model);
  ASSERT_EQ(2u, waits_.size());
  EXPECT_GE(waits_[0].count(), 100);
  EXPECT_LE(waits_[0].count(), 150);
  EXPECT_GE(waits_[1].count(), 200);
  EXPECT_LE(waits_[1].count(), 300);
  EXPECT_EQ(CircuitBreaker::State::kClosed,
            caller.BreakerFor("fast").CurrentState());
}

TEST_F(ResilientCallerTest, GivesUpAfterMaxAttempts) {
  EXPECT_CALL(*client_, Call("fast", _, _, _))
      .Times(3)
      .WillRepeatedly(Throw(ModelCallError("rate limit", 429)));
  auto caller = MakeCaller();

  EXPECT_THROW(caller.GuardedCall("fast", ModelRequest{}), ModelCallError);
  EXPECT_EQ(2u, waits_.size());
}

TEST_F(ResilientCallerTest, DoesNotRetryClientErrors) {
  EXPECT_CALL(*client_, Call("fast", _, _, _))
      .Times(1)
      .WillOnce(Throw(ModelCallError("forbidden", 403)));
  auto caller = MakeCaller();

  EXPECT_THROW(caller.GuardedCall("fast", ModelRequest{}), ModelCallError);
  EXPECT_TRUE(waits_.empty());
}

TEST_F(ResilientCallerTest, OpenBreakerRejectsWithoutCalling) {
  EXPECT_CALL(*client_, Call("fast", _, _, _))
      .Times(2)
      .WillRepeatedly(Throw(ModelCallError("upstream", 503)));
  auto caller = MakeCaller();

  EXPECT_THROW(caller.GuardedCall("fast", ModelRequest{}), ModelCallError);
  EXPECT_THROW(caller.GuardedCall("fast", ModelRequest{}), ModelCallError);
  EXPECT_THROW(caller.GuardedCall("fast", ModelRequest{}), CircuitOpenError);
}

TEST_F(ResilientCallerTest, FallsBackPastFailuresAndShortAnswers) {
  EXPECT_CALL(*client_, Call("primary", _, _, _))
      .WillOnce(Throw(CallTimeoutError("timed out")));
  EXPECT_CALL(*client_, Call("secondary", _, _, _))
      .WillOnce(Return(Answer("```\nok\n```")));
  EXPECT_CALL(*client_, Call("tertiary", _, _, _))
      .WillOnce(Return(Answer("```markdown\nA full answer\n```")));
  auto caller = MakeCaller();
  ModelRequest request;
  request.min_content_length = 5;

  const auto result =
      caller.CallWithFallback({"primary", "secondary", "tertiary"}, request);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ("tertiary", result->model);
  EXPECT_EQ("A full answer", result->content);
  EXPECT_THAT(log_.str(), HasSubstr("\"error_class\": \"timeout\""));
  EXPECT_THAT(log_.str(), HasSubstr("model.response.rejected"));
}

TEST_F(ResilientCallerTest, ExhaustedChainReturnsNoResult) {
  EXPECT_CALL(*client_, Call(_, _, _, _))
      .WillRepeatedly(Throw(ModelCallError("bad request", 400)));
  auto caller = MakeCaller();

  EXPECT_FALSE(caller.CallWithFallback({"a", "b"}, ModelRequest{}).has_value());
  EXPECT_THAT(log_.str(), HasSubstr("model.chain.exhausted"));
}

TEST_F(ResilientCallerTest, SkipsModelsWithOpenCircuit) {
  EXPECT_CALL(*client_, Call("flaky", _, _, _))
      .Times(2)
      .WillRepeatedly(Throw(ModelCallError("upstream", 500)));
  EXPECT_CALL(*client_, Call("steady", _, _, _))
      .Times(3)
      .WillRepeatedly(Return(Answer("steady answer")));
  auto caller = MakeCaller();

  for (int i = 0; i < 3; ++i) {
    const auto result =
        caller.CallWithFallback({"flaky", "steady"}, ModelRequest{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("steady", result->model);
  }
  EXPECT_THAT(log_.str(), HasSubstr("model.circuit.open"));
}

TEST_F(ResilientCallerTest, SuccessfulCallsAreTraced) {
  auto dispatcher = std::make_shared<TraceDispatcher>();
  auto costs = std::make_shared<CostAggregatorHandler>();
  dispatcher->Register(costs);
  EXPECT_CALL(*client_, Call("fast", _, _, _))
      .WillOnce(Return(Answer("traced")));
  ResilientCaller caller(client_, retry_, breaker_, nullptr, dispatcher,
                         [](std::chrono::milliseconds) {});

  caller.GuardedCall("fast", ModelRequest{}, "run:demo");

  const auto cost = costs->CostFor("run:demo");
  EXPECT_EQ(1, cost.call_count);
  EXPECT_EQ(10, cost.input_tokens);
  EXPECT_DOUBLE_EQ(0.25, cost.total_cost);
}

TEST(ResilientCallerConfigTest, RejectsZeroAttempts) {
  RetryPolicy retry;
  retry.max_attempts = 0;
  EXPECT_THROW(ResilientCaller(nullptr, retry, BreakerPolicy{}),
               std::invalid_argument);
}

TEST(StripMarkdownFencesTest, RemovesFenceAndLanguageTag) {
  EXPECT_EQ("body", StripMarkdownFences("```json\nbody\n```"));
  EXPECT_EQ("plain", StripMarkdownFences("  plain \n"));
  EXPECT_EQ("", StripMarkdownFences("```"));
}

} // namespace
} // namespace scribe
