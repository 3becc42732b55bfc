#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "bgame/broadcast.hpp"
#include "fixtures.hpp"

namespace fx = bgame::fixtures;
using namespace std::chrono_literals;

TEST(Broadcast, PublishWithoutSubscribersIsDropped) {
  bgame::BroadcastBus bus{4};
  EXPECT_EQ(bus.publish(bgame::RoundEnded{}), 0u);

  auto sub = bus.subscribe();
  EXPECT_FALSE(sub->try_next().has_value());
}

TEST(Broadcast, SubscribersSeeEventsInOrder) {
  bgame::BroadcastBus bus{8};
  auto a = bus.subscribe();
  auto b = bus.subscribe();

  EXPECT_EQ(bus.publish(bgame::SubmissionAck{1}), 2u);
  EXPECT_EQ(bus.publish(bgame::RoundEnded{}), 2u);
  EXPECT_EQ(bus.publish(bgame::KickAll{}), 2u);

  const std::vector<bgame::LobbyEventType> expected{
    bgame::LobbyEventType::SubmissionAck, bgame::LobbyEventType::RoundEnded, bgame::LobbyEventType::KickAll};
  EXPECT_EQ(fx::types_of(fx::drain(*a)), expected);
  EXPECT_EQ(fx::types_of(fx::drain(*b)), expected);
}

TEST(Broadcast, LateSubscriberStartsAtTheTail) {
  bgame::BroadcastBus bus{8};
  auto early = bus.subscribe();
  bus.publish(bgame::RoundEnded{});

  auto late = bus.subscribe();
  bus.publish(bgame::KickAll{});

  EXPECT_EQ(fx::drain(*early).size(), 2u);
  const auto seen = fx::drain(*late);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(bgame::type_of(seen[0]), bgame::LobbyEventType::KickAll);
}

TEST(Broadcast, LaggingReaderSkipsAheadAndCountsMissed) {
  bgame::BroadcastBus bus{2};
  auto sub = bus.subscribe();

  for (bgame::PlayerId p = 1; p <= 5; ++p) bus.publish(bgame::SubmissionAck{p});

  const auto seen = fx::drain(*sub);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(std::get<bgame::SubmissionAck>(seen[0]).player, 4u);
  EXPECT_EQ(std::get<bgame::SubmissionAck>(seen[1]).player, 5u);
  EXPECT_EQ(sub->missed(), 3u);
}

TEST(Broadcast, WaitTimesOutWhenIdle) {
  bgame::BroadcastBus bus{2};
  auto sub = bus.subscribe();
  EXPECT_FALSE(sub->wait_next(5ms).has_value());
}

TEST(Broadcast, WaitWakesOnPublish) {
  bgame::BroadcastBus bus{2};
  auto sub = bus.subscribe();

  std::thread producer([&] {
    std::this_thread::sleep_for(10ms);
    bus.publish(bgame::RoundEnded{});
  });
  const auto ev = sub->wait_next(5s);
  producer.join();

  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(bgame::type_of(*ev), bgame::LobbyEventType::RoundEnded);
}

TEST(Broadcast, CloseDrainsThenReportsClosed) {
  bgame::BroadcastBus bus{4};
  auto sub = bus.subscribe();
  bus.publish(bgame::KickAll{});
  bus.close();

  EXPECT_EQ(bus.publish(bgame::RoundEnded{}), 0u);
  EXPECT_FALSE(sub->closed());
  EXPECT_TRUE(sub->wait_next(1s).has_value());
  EXPECT_TRUE(sub->closed());
  EXPECT_FALSE(sub->wait_next(1s).has_value());
}

TEST(Broadcast, SubscriberCountTracksLifetime) {
  bgame::BroadcastBus bus{4};
  {
    auto a = bus.subscribe();
    auto b = bus.subscribe();
    EXPECT_EQ(bus.subscriber_count(), 2u);
  }
  EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST(Broadcast, AddressedEventsOnlyReachTheirPlayer) {
  EXPECT_TRUE(bgame::visible_to(bgame::SubmissionAck{1}, 1));
  EXPECT_FALSE(bgame::visible_to(bgame::SubmissionAck{1}, 2));
  EXPECT_FALSE(bgame::visible_to(bgame::PlayerError{1, {}}, 2));
  EXPECT_TRUE(bgame::visible_to(bgame::PopUp{std::nullopt, "all"}, 2));
  EXPECT_FALSE(bgame::visible_to(bgame::PopUp{1, "one"}, 2));
  EXPECT_TRUE(bgame::visible_to(bgame::ResourceGranted{2, bgame::Resource::Money, 5}, 2));
  EXPECT_TRUE(bgame::visible_to(bgame::RoundEnded{}, 9));
}
