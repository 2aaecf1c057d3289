#include <gtest/gtest.h>

#include <map>

#include "identity.hh"

namespace trafficmon {
namespace {

struct IdentityTest : testing::Test {
  LeaseTable leases = ParseLeases(
      "1718000000 AA:BB:CC:DD:EE:FF 10.0.0.5 laptop *\n"
      "1718000000 11:22:33:44:55:66 10.0.0.7 * *\n"
      "1718000000 not-a-mac 10.0.0.8 printer *\n");
  std::map<IP, Str> neighbors = {
      {IP(10, 0, 0, 8), "de:ad:be:ef:00:08"},
      {IP(10, 0, 0, 9), "DE:AD:BE:EF:00:09"},
      {IP(10, 0, 0, 10), "00:00:00:00:00"},
  };
  int neighbor_queries = 0;

  IdentityResolver Resolver() {
    return IdentityResolver{
        .leases = leases,
        .neighbors = [this](IP ip) -> std::optional<Str> {
          ++neighbor_queries;
          auto it = neighbors.find(ip);
          if (it == neighbors.end()) {
            return std::nullopt;
          }
          return it->second;
        },
    };
  }
};

TEST_F(IdentityTest, LeaseProvidesMACAndHostname) {
  auto identity = Resolver().Resolve(IP(10, 0, 0, 5));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->mac, "aa:bb:cc:dd:ee:ff");
  EXPECT_EQ(identity->name, "laptop");
  EXPECT_EQ(neighbor_queries, 0);
}

TEST_F(IdentityTest, AnonymousLeaseIsNamedByAddress) {
  auto identity = Resolver().Resolve(IP(10, 0, 0, 7));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->mac, "11:22:33:44:55:66");
  EXPECT_EQ(identity->name, "10.0.0.7");
}

TEST_F(IdentityTest, FallsBackToNeighborCacheWithoutLease) {
  auto identity = Resolver().Resolve(IP(10, 0, 0, 9));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->mac, "de:ad:be:ef:00:09");
  EXPECT_EQ(identity->name, "10.0.0.9");
}

TEST_F(IdentityTest, MalformedLeaseMACIsUnresolved) {
  EXPECT_FALSE(Resolver().Resolve(IP(10, 0, 0, 8)).has_value());
}

TEST_F(IdentityTest, MalformedNeighborMACIsUnresolved) {
  EXPECT_FALSE(Resolver().Resolve(IP(10, 0, 0, 10)).has_value());
}

TEST_F(IdentityTest, UnknownAddressIsUnresolved) {
  EXPECT_FALSE(Resolver().Resolve(IP(10, 0, 0, 99)).has_value());
}

} // namespace
} // namespace trafficmon
