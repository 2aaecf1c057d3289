#include <gtest/gtest.h>

#include <sys/stat.h>

#include "calendar.hh"
#include "fake_packet_filter.hh"
#include "temp_dir.hh"
#include "traffic_engine.hh"

namespace trafficmon {
namespace {

const IP kLaptop(10, 0, 0, 5);
const IP kStranger(10, 0, 0, 66);
const IP kBroker(10, 0, 0, 2);

CounterSample Sample(IP ip, Direction direction, U64 bytes) {
  return CounterSample{
      .ip = ip, .direction = direction, .bytes = bytes, .packets = 1};
}

TEST(ComputeBandwidthTest, DividesDeltaByInterval) {
  auto result =
      ComputeBandwidth({Sample(kLaptop, Direction::Inbound, 1000)},
                       {Sample(kLaptop, Direction::Inbound, 1500)}, 5);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].bytes, 1500u);
  EXPECT_EQ(result[0].bandwidth, 100u);
}

TEST(ComputeBandwidthTest, RoundsDown) {
  auto result =
      ComputeBandwidth({Sample(kLaptop, Direction::Inbound, 0)},
                       {Sample(kLaptop, Direction::Inbound, 14)}, 5);
  EXPECT_EQ(result[0].bandwidth, 2u);
}

TEST(ComputeBandwidthTest, CounterDecreaseGivesZero) {
  auto result =
      ComputeBandwidth({Sample(kLaptop, Direction::Outbound, 5000)},
                       {Sample(kLaptop, Direction::Outbound, 20)}, 5);
  EXPECT_EQ(result[0].bandwidth, 0u);
}

TEST(ComputeBandwidthTest, NewEntryStartsFromZero) {
  auto result = ComputeBandwidth({}, {Sample(kLaptop, Direction::Inbound, 50)}, 5);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].bandwidth, 10u);
}

TEST(ComputeBandwidthTest, JoinsOnAddressAndDirection) {
  auto result = ComputeBandwidth(
      {Sample(kLaptop, Direction::Outbound, 100),
       Sample(kLaptop, Direction::Inbound, 1000)},
      {Sample(kLaptop, Direction::Inbound, 1500),
       Sample(kLaptop, Direction::Outbound, 200)},
      5);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].direction, Direction::Inbound);
  EXPECT_EQ(result[0].bandwidth, 100u);
  EXPECT_EQ(result[1].direction, Direction::Outbound);
  EXPECT_EQ(result[1].bandwidth, 20u);
}

TEST(UpdateBaselineTest, SameDayAccumulates) {
  BaselineRecord record{.day_bytes = 1200,
                        .day_date = "2024-06-10",
                        .week_bytes = 1000,
                        .week_num = "2024-W24"};
  PeriodUsage usage =
      UpdateBaseline(record, 1500, 1718000000, "2024-06-10", "2024-W24");
  EXPECT_EQ(usage.daily, 300u);
  EXPECT_EQ(usage.weekly, 500u);
  EXPECT_EQ(record.day_bytes, 1200u);
  EXPECT_EQ(record.bw_bytes, 1500u);
  EXPECT_EQ(record.bw_ts, 1718000000);
}

TEST(UpdateBaselineTest, CounterResetRestartsPeriods) {
  BaselineRecord record{.day_bytes = 1200,
                        .day_date = "2024-06-10",
                        .week_bytes = 1200,
                        .week_num = "2024-W24"};
  PeriodUsage usage =
      UpdateBaseline(record, 50, 1718000000, "2024-06-10", "2024-W24");
  EXPECT_EQ(usage.daily, 0u);
  EXPECT_EQ(usage.weekly, 0u);
  EXPECT_EQ(record.day_bytes, 50u);
  EXPECT_EQ(record.day_date, "2024-06-10");
  EXPECT_EQ(record.week_bytes, 50u);
}

TEST(UpdateBaselineTest, NewDayStartsAtCurrentCounter) {
  BaselineRecord record{.day_bytes = 1200,
                        .day_date = "2024-06-10",
                        .week_bytes = 1000,
                        .week_num = "2024-W24"};
  PeriodUsage usage =
      UpdateBaseline(record, 5000, 1718100000, "2024-06-11", "2024-W24");
  EXPECT_EQ(usage.daily, 0u);
  EXPECT_EQ(usage.weekly, 4000u);
  EXPECT_EQ(record.day_bytes, 5000u);
  EXPECT_EQ(record.day_date, "2024-06-11");

  usage = UpdateBaseline(record, 5600, 1718100060, "2024-06-11", "2024-W24");
  EXPECT_EQ(usage.daily, 600u);
}

TEST(UpdateBaselineTest, NewWeekStartsAtCurrentCounter) {
  BaselineRecord record{.day_bytes = 1200,
                        .day_date = "2024-06-16",
                        .week_bytes = 1000,
                        .week_num = "2024-W24"};
  PeriodUsage usage =
      UpdateBaseline(record, 3000, 1718600000, "2024-06-17", "2024-W25");
  EXPECT_EQ(usage.weekly, 0u);
  EXPECT_EQ(record.week_num, "2024-W25");
}

TEST(UpdateBaselineTest, FreshRecordStartsAtZero) {
  BaselineRecord record;
  PeriodUsage usage =
      UpdateBaseline(record, 777, 1718000000, "2024-06-10", "2024-W24");
  EXPECT_EQ(usage.daily, 0u);
  EXPECT_EQ(usage.weekly, 0u);
}

struct TrafficEngineTest : testing::Test {
  TempDir dir;
  FakePacketFilter filter;
  LeaseTable leases = ParseLeases(
      "1718000000 aa:bb:cc:dd:ee:ff 10.0.0.5 laptop *\n"
      "1718000000 02:00:00:00:00:02 10.0.0.2 broker *\n");
  IdentityResolver identity{.leases = leases, .neighbors = nullptr};
  BaselineStore store{dir.path / "state"};
  time_t now = 1718000000;
  std::vector<U64> slept;

  TrafficEngine Engine() {
    return TrafficEngine{
        .filter = filter,
        .identity = identity,
        .store = store,
        .interval_seconds = 5,
        .skip_ip = kBroker,
        .sleep =
            [this](U64 seconds) {
              slept.push_back(seconds);
              filter.SetCounter(kLaptop, Direction::Inbound, 1500, 15);
              filter.SetCounter(kLaptop, Direction::Outbound, 600, 6);
              filter.SetCounter(kBroker, Direction::Inbound, 9000, 90);
            },
        .clock = [this] { return now; },
    };
  }
};

TEST_F(TrafficEngineTest, ReportsBandwidthOfKnownDevice) {
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);
  filter.AddOwned(kLaptop, Direction::Outbound, 100, 1);

  int matched = 0;
  Status status;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(slept.size(), 1u);
  EXPECT_EQ(slept[0], 5u);
  EXPECT_EQ(matched, 2);
  ASSERT_EQ(reports.size(), 2u);

  const TrafficReport &in = reports[0];
  EXPECT_EQ(in.ip, kLaptop);
  EXPECT_EQ(in.mac, "aa:bb:cc:dd:ee:ff");
  EXPECT_EQ(in.name, "laptop");
  EXPECT_EQ(in.direction, Direction::Inbound);
  EXPECT_EQ(in.bytes, 1500u);
  EXPECT_EQ(in.packets, 15u);
  EXPECT_EQ(in.bandwidth, 100u);
  EXPECT_EQ(in.daily, 0u);
  EXPECT_EQ(in.timestamp, now);

  EXPECT_EQ(reports[1].direction, Direction::Outbound);
  EXPECT_EQ(reports[1].bandwidth, 100u);
}

TEST_F(TrafficEngineTest, PersistsBaselines) {
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);
  int matched = 0;
  Status status;
  Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();

  auto record = store.Load("aa:bb:cc:dd:ee:ff", Direction::Inbound, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->bw_bytes, 1500u);
  EXPECT_EQ(record->bw_ts, now);
  EXPECT_EQ(record->day_bytes, 1500u);
  EXPECT_EQ(record->day_date, DayKey(now));
  EXPECT_EQ(record->week_num, WeekKey(now));
}

TEST_F(TrafficEngineTest, DailyUsageGrowsFromStoredBaseline) {
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);
  BaselineRecord stored{.day_bytes = 1200,
                        .day_date = DayKey(now),
                        .week_bytes = 200,
                        .week_num = WeekKey(now)};
  Status status;
  store.Save("aa:bb:cc:dd:ee:ff", Direction::Inbound, stored, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();

  int matched = 0;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].daily, 300u);
  EXPECT_EQ(reports[0].weekly, 1300u);
}

TEST_F(TrafficEngineTest, SkipsUnresolvedAddresses) {
  filter.AddOwned(kStranger, Direction::Inbound, 10, 1);
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);

  int matched = 0;
  Status status;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(matched, 2);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].ip, kLaptop);
}

TEST_F(TrafficEngineTest, SkipsBroker) {
  filter.AddOwned(kBroker, Direction::Inbound, 100, 1);
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);

  int matched = 0;
  Status status;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].ip, kLaptop);
  EXPECT_FALSE(store.RecordPath("02:00:00:00:00:02", Direction::Inbound)
                   .Exists());
}

TEST_F(TrafficEngineTest, NoCountersMeansNoWait) {
  filter.AddForeign("allow ssh");
  int matched = 0;
  Status status;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_TRUE(reports.empty());
  EXPECT_TRUE(slept.empty());
  EXPECT_EQ(matched, 0);
}

TEST_F(TrafficEngineTest, UnwritableStoreSkipsPublication) {
  filter.AddOwned(kLaptop, Direction::Inbound, 1000, 10);
  // A regular file where the state directory should be.
  Status status;
  WriteFileAtomic(store.dir, "", status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();

  int matched = 0;
  auto reports = Engine().Run(matched, status);
  ASSERT_TRUE(status.Ok()) << status.ToStr();
  EXPECT_EQ(matched, 1);
  EXPECT_TRUE(reports.empty());
}

TEST_F(TrafficEngineTest, ListingFailureIsReported) {
  filter.fail_list = true;
  int matched = 0;
  Status status;
  auto reports = Engine().Run(matched, status);
  EXPECT_FALSE(status.Ok());
  EXPECT_TRUE(reports.empty());
}

} // namespace
} // namespace trafficmon
