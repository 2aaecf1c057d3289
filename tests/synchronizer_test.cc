#include <gtest/gtest.h>

#include "fake_packet_filter.hh"
#include "synchronizer.hh"

namespace trafficmon {
namespace {

const IP kLaptop(10, 0, 0, 5);
const IP kPhone(10, 0, 0, 7);
const IP kGone(10, 0, 0, 9);

LeaseTable TwoLeases() {
  return ParseLeases("1 aa:bb:cc:dd:ee:ff 10.0.0.5 laptop *\n"
                     "1 11:22:33:44:55:66 10.0.0.7 phone *\n");
}

TEST(SynchronizerTest, CreatesContainerWhenMissing) {
  FakePacketFilter filter;
  filter.table = false;
  filter.chain = false;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(filter.create_table_calls, 1);
  EXPECT_EQ(filter.create_chain_calls, 1);
}

TEST(SynchronizerTest, KeepsExistingContainer) {
  FakePacketFilter filter;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(filter.create_table_calls, 0);
  EXPECT_EQ(filter.create_chain_calls, 0);
}

TEST(SynchronizerTest, ContainerFailureAbortsCycle) {
  FakePacketFilter filter;
  filter.table = false;
  filter.fail_create = true;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncRules(filter, &leases, status);
  EXPECT_FALSE(status.Ok());
  EXPECT_EQ(filter.add_calls, 0);
}

TEST(SynchronizerTest, EveryLeasedAddressGetsBothDirections) {
  FakePacketFilter filter;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.added, 4);
  for (IP ip : {kLaptop, kPhone}) {
    for (Direction direction : kDirections) {
      EXPECT_EQ(filter.Count(ip, direction), 1);
    }
  }
}

TEST(SynchronizerTest, SecondRunChangesNothing) {
  FakePacketFilter filter;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  int adds = filter.add_calls;
  int deletes = filter.delete_calls;

  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(filter.add_calls, adds);
  EXPECT_EQ(filter.delete_calls, deletes);
  EXPECT_EQ(report.kept, 4);
  EXPECT_EQ(report.added, 0);
  EXPECT_EQ(report.deleted, 0);
}

TEST(SynchronizerTest, AddsOnlyTheMissingDirection) {
  FakePacketFilter filter;
  filter.AddOwned(kLaptop, Direction::Outbound, 123, 1);
  LeaseTable leases = ParseLeases("1 aa:bb:cc:dd:ee:ff 10.0.0.5 laptop *\n");
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.added, 1);
  EXPECT_EQ(report.kept, 1);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Inbound), 1);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Outbound), 1);
}

TEST(SynchronizerTest, DeletesStaleRulesAndKeepsForeignOnes) {
  FakePacketFilter filter;
  U64 foreign = filter.AddForeign("allow ssh");
  filter.AddOwned(kGone, Direction::Inbound);
  filter.AddOwned(kGone, Direction::Outbound);
  LeaseTable leases = TwoLeases();
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.deleted, 2);
  EXPECT_EQ(filter.Count(kGone, Direction::Inbound), 0);
  EXPECT_EQ(filter.Count(kGone, Direction::Outbound), 0);
  ASSERT_FALSE(filter.rules.empty());
  EXPECT_EQ(filter.rules.front().handle, foreign);
}

TEST(SynchronizerTest, DuplicateRulesAreReducedToOne) {
  FakePacketFilter filter;
  U64 first = filter.AddOwned(kLaptop, Direction::Inbound, 100, 1);
  U64 second = filter.AddOwned(kLaptop, Direction::Inbound, 40, 1);
  filter.AddOwned(kLaptop, Direction::Outbound);
  LeaseTable leases = ParseLeases("1 aa:bb:cc:dd:ee:ff 10.0.0.5 laptop *\n");
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.deleted, 1);
  EXPECT_EQ(report.kept, 2);
  EXPECT_EQ(report.added, 0);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Inbound), 1);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Outbound), 1);
  bool first_kept = false;
  for (auto &rule : filter.rules) {
    EXPECT_NE(rule.handle, second);
    first_kept |= rule.handle == first;
  }
  EXPECT_TRUE(first_kept);

  report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.deleted, 0);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Inbound), 1);
}

TEST(SynchronizerTest, EmptyLeaseTableDeletesNothing) {
  FakePacketFilter filter;
  filter.AddOwned(kLaptop, Direction::Inbound);
  filter.AddOwned(kLaptop, Direction::Outbound);
  LeaseTable leases = ParseLeases("");
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.deleted, 0);
  EXPECT_EQ(filter.delete_calls, 0);
  EXPECT_EQ(filter.rules.size(), 2u);
}

TEST(SynchronizerTest, UnreadableLeasesChangeNoRules) {
  FakePacketFilter filter;
  filter.chain = false;
  filter.AddOwned(kLaptop, Direction::Inbound);
  Status status;
  SyncRules(filter, nullptr, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(filter.create_chain_calls, 1);
  EXPECT_EQ(filter.add_calls, 0);
  EXPECT_EQ(filter.delete_calls, 0);
}

TEST(SynchronizerTest, FailuresDoNotStopOtherChanges) {
  FakePacketFilter filter;
  U64 stuck = filter.AddOwned(kGone, Direction::Inbound);
  filter.AddOwned(kGone, Direction::Outbound);
  filter.failing_deletes.insert(stuck);
  filter.failing_adds.insert(EncodeTag(kLaptop, Direction::Outbound));
  LeaseTable leases = TwoLeases();
  Status status;
  SyncReport report = SyncRules(filter, &leases, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(report.failed, 2);
  EXPECT_EQ(report.added, 3);
  EXPECT_EQ(report.deleted, 1);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Inbound), 1);
  EXPECT_EQ(filter.Count(kLaptop, Direction::Outbound), 0);
  EXPECT_EQ(filter.Count(kGone, Direction::Inbound), 1);
}

TEST(SynchronizerTest, ListingFailureIsReported) {
  FakePacketFilter filter;
  filter.fail_list = true;
  LeaseTable leases = TwoLeases();
  Status status;
  SyncRules(filter, &leases, status);
  EXPECT_FALSE(status.Ok());
  EXPECT_EQ(filter.add_calls, 0);
}

} // namespace
} // namespace trafficmon
