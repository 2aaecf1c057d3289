#include <gtest/gtest.h>

#include "counters.hh"
#include "fake_packet_filter.hh"

namespace trafficmon {
namespace {

TEST(CountersTest, ListsOnlyOwnedRules) {
  FakePacketFilter filter;
  filter.AddForeign("allow ssh");
  U64 handle = filter.AddOwned(IP(10, 0, 0, 5), Direction::Inbound, 100, 2);
  filter.AddForeign("");
  filter.AddForeign("tm:10.0.0.5:sideways");

  Status status;
  auto owned = ListOwnedRules(filter, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(owned.size(), 1u);
  EXPECT_EQ(owned[0].handle, handle);
  EXPECT_EQ(owned[0].tag.ip, IP(10, 0, 0, 5));
  EXPECT_EQ(owned[0].tag.direction, Direction::Inbound);
}

TEST(CountersTest, ReadsCountersInListingOrder) {
  FakePacketFilter filter;
  filter.AddOwned(IP(10, 0, 0, 7), Direction::Outbound, 500, 5);
  filter.AddOwned(IP(10, 0, 0, 5), Direction::Inbound, 1000, 10);

  Status status;
  auto samples = ReadCounters(filter, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_EQ(samples[0].ip, IP(10, 0, 0, 7));
  EXPECT_EQ(samples[0].direction, Direction::Outbound);
  EXPECT_EQ(samples[0].bytes, 500u);
  EXPECT_EQ(samples[0].packets, 5u);
  EXPECT_EQ(samples[1].ip, IP(10, 0, 0, 5));
  EXPECT_EQ(samples[1].bytes, 1000u);
}

TEST(CountersTest, DropsRulesWithoutCounter) {
  FakePacketFilter filter;
  filter.AddOwned(IP(10, 0, 0, 5), Direction::Inbound, 1000, 10);
  filter.rules.push_back(
      netfilter::Rule{.handle = 99, .comment = "tm:10.0.0.6:in"});

  Status status;
  auto samples = ReadCounters(filter, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_EQ(samples[0].ip, IP(10, 0, 0, 5));
}

TEST(CountersTest, ListingFailureIsReported) {
  FakePacketFilter filter;
  filter.fail_list = true;
  Status status;
  auto samples = ReadCounters(filter, status);
  EXPECT_FALSE(status.Ok());
  EXPECT_TRUE(samples.empty());
}

} // namespace
} // namespace trafficmon
