#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "warden/core/event_channel.h"

using namespace warden;

TEST(EventChannelTest, DeliversInSubscriptionOrder) {
  EventChannel<std::string> channel;
  std::vector<std::string> seen;

  channel.subscribe([&](const std::string& e) { seen.push_back("a:" + e); });
  channel.subscribe([&](const std::string& e) { seen.push_back("b:" + e); });
  channel.emit("ready");

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "a:ready");
  EXPECT_EQ(seen[1], "b:ready");
}

TEST(EventChannelTest, Unsubscribe) {
  EventChannel<int> channel;
  int calls = 0;
  auto id = channel.subscribe([&](const int&) { ++calls; });

  channel.emit(1);
  channel.unsubscribe(id);
  channel.emit(2);

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(channel.subscriberCount(), 0u);
}

TEST(EventChannelTest, ThrowingSubscriberDoesNotStopOthers) {
  EventChannel<int> channel;
  int calls = 0;
  channel.subscribe([](const int&) { throw std::runtime_error("boom"); });
  channel.subscribe([&](const int&) { ++calls; });

  EXPECT_NO_THROW(channel.emit(7));
  EXPECT_EQ(calls, 1);
}

TEST(EventChannelTest, SubscriberMayUnsubscribeItself) {
  EventChannel<int> channel;
  int calls = 0;
  EventChannel<int>::SubscriptionId id = 0;
  id = channel.subscribe([&](const int&) {
    ++calls;
    channel.unsubscribe(id);
  });

  channel.emit(1);
  channel.emit(2);
  EXPECT_EQ(calls, 1);
}
