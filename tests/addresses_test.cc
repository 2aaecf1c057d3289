#include <gtest/gtest.h>

#include "ip.hh"
#include "mac.hh"

namespace trafficmon {
namespace {

TEST(IPTest, ParsesDottedQuad) {
  IP ip;
  ASSERT_TRUE(ip.TryParse("192.168.1.10"));
  EXPECT_EQ(ip, IP(192, 168, 1, 10));
  EXPECT_EQ(ToStr(ip), "192.168.1.10");
}

TEST(IPTest, RejectsEverythingElse) {
  IP ip(1, 2, 3, 4);
  EXPECT_FALSE(ip.TryParse(""));
  EXPECT_FALSE(ip.TryParse("1.2.3"));
  EXPECT_FALSE(ip.TryParse("1.2.3.4.5"));
  EXPECT_FALSE(ip.TryParse("256.1.1.1"));
  EXPECT_FALSE(ip.TryParse("1..2.3"));
  EXPECT_FALSE(ip.TryParse("0001.2.3.4"));
  EXPECT_FALSE(ip.TryParse(" 1.2.3.4"));
  EXPECT_FALSE(ip.TryParse("fd00::1"));
  EXPECT_EQ(ip, IP(1, 2, 3, 4));
}

TEST(IPTest, OrdersNumerically) {
  EXPECT_LT(IP(10, 0, 0, 2), IP(10, 0, 0, 10));
  EXPECT_LT(IP(9, 255, 255, 255), IP(10, 0, 0, 0));
}

TEST(MACTest, CanonicalFormIsLowercase) {
  EXPECT_EQ(CanonicalMAC("AA:BB:CC:DD:EE:FF"), "aa:bb:cc:dd:ee:ff");
  EXPECT_EQ(CanonicalMAC("00:11:22:33:44:55"), "00:11:22:33:44:55");
}

TEST(MACTest, RejectsNonCanonicalForms) {
  EXPECT_EQ(CanonicalMAC(""), "");
  EXPECT_EQ(CanonicalMAC("aa-bb-cc-dd-ee-ff"), "");
  EXPECT_EQ(CanonicalMAC("a:b:c:d:e:f"), "");
  EXPECT_EQ(CanonicalMAC("aa:bb:cc:dd:ee"), "");
  EXPECT_EQ(CanonicalMAC("aa:bb:cc:dd:ee:fg"), "");
  EXPECT_EQ(CanonicalMAC("aa:bb:cc:dd:ee:ff:00"), "");
}

} // namespace
} // namespace trafficmon
