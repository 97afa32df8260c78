#include <scribe/progress_channel.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <string>
#include <vector>

namespace scribe {
namespace {

StreamEnvelope StageNamed(const std::string &name) {
  StageEvent event;
  event.name = name;
  event.status = StageProgress::kRunning;
  return MakeStageEnvelope(event);
}

std::vector<std::string> Drain(EventStream &stream) {
  std::vector<std::string> names;
  while (const auto envelope = stream.Next()) {
    names.push_back(envelope->stage ? envelope->stage->name
                                    : ToString(envelope->kind));
  }
  return names;
}

TEST(ProgressChannelTest, LateSubscriberAfterCompleteReplaysHistory) {
  ProgressChannel channel;
  channel.CreateChannel("analyze:demo");
  channel.Publish("analyze:demo", StageNamed("ingestion_resolve"));
  channel.Publish("analyze:demo", StageNamed("ingestion_detect"));
  channel.Complete("analyze:demo");

  auto subscription = channel.Subscribe("analyze:demo");

  EXPECT_THAT(Drain(*subscription),
              ::testing::ElementsAre("ingestion_resolve", "ingestion_detect"));
}

TEST(ProgressChannelTest, SubscriberFollowsLiveEventsUntilComplete) {
  ProgressChannel channel;
  channel.CreateChannel("run");
  channel.Publish("run", StageNamed("quality"));
  auto subscription = channel.Subscribe("run");

  auto consumer = std::async(std::launch::async,
                             [&subscription] { return Drain(*subscription); });
  channel.Publish("run", StageNamed("persistence"));
  channel.Publish("run", MakeErrorEnvelope("failed"));
  channel.Complete("run");

  EXPECT_THAT(consumer.get(),
              ::testing::ElementsAre("quality", "persistence", "error"));
}

TEST(ProgressChannelTest, UnknownKeyYieldsFinishedStream) {
  ProgressChannel channel;
  channel.Publish("missing", StageNamed("quality"));

  auto subscription = channel.Subscribe("missing");

  EXPECT_FALSE(subscription->Next().has_value());
  EXPECT_FALSE(channel.HasChannel("missing"));
  EXPECT_TRUE(channel.LatestEvents("missing").empty());
}

TEST(ProgressChannelTest, CompleteIsIdempotentAndStopsPublishing) {
  ProgressChannel channel;
  channel.CreateChannel("run");
  EXPECT_TRUE(channel.IsActive("run"));

  channel.Complete("run");
  channel.Complete("run");
  channel.Publish("run", StageNamed("late"));

  EXPECT_TRUE(channel.HasChannel("run"));
  EXPECT_FALSE(channel.IsActive("run"));
  EXPECT_TRUE(channel.LatestEvents("run").empty());
}

TEST(ProgressChannelTest, RecreatingResetsHistoryAndEndsOldReaders) {
  ProgressChannel channel;
  channel.CreateChannel("run");
  channel.Publish("run", StageNamed("first_run"));
  auto old_reader = channel.Subscribe("run");

  channel.CreateChannel("run");
  channel.Publish("run", StageNamed("second_run"));

  EXPECT_THAT(Drain(*old_reader), ::testing::ElementsAre("first_run"));
  ASSERT_EQ(1u, channel.LatestEvents("run").size());
  EXPECT_EQ("second_run", channel.LatestEvents("run")[0].stage->name);
}

TEST(ProgressChannelTest, ReleaseDropsHistoryButKeepsSubscriptions) {
  ProgressChannel channel;
  channel.CreateChannel("run");
  channel.Publish("run", StageNamed("quality"));
  auto subscription = channel.Subscribe("run");

  channel.Release("run");

  EXPECT_FALSE(channel.HasChannel("run"));
  EXPECT_THAT(Drain(*subscription), ::testing::ElementsAre("quality"));
}

TEST(DeliveryQueueTest, DeliversEverythingPushedBeforeClose) {
  DeliveryQueue queue;
  queue.Push(StageNamed("quality"));
  queue.Push(MakePausedEnvelope());
  queue.Close();
  queue.Push(StageNamed("ignored"));

  EXPECT_TRUE(queue.Closed());
  EXPECT_THAT(Drain(queue), ::testing::ElementsAre("quality", "paused"));
}

} // namespace
} // namespace scribe
