#include <gtest/gtest.h>

#include "rule_tag.hh"

namespace trafficmon {
namespace {

TEST(RuleTagTest, EncodesMarkerAddressAndDirection) {
  EXPECT_EQ(EncodeTag(IP(10, 0, 0, 5), Direction::Inbound), "tm:10.0.0.5:in");
  EXPECT_EQ(EncodeTag(IP(192, 168, 1, 20), Direction::Outbound),
            "tm:192.168.1.20:out");
}

TEST(RuleTagTest, DecodesOwnTags) {
  auto tag = DecodeTag("tm:192.168.1.10:in");
  ASSERT_TRUE(tag.has_value());
  EXPECT_EQ(tag->ip, IP(192, 168, 1, 10));
  EXPECT_EQ(tag->direction, Direction::Inbound);

  tag = DecodeTag("tm:10.0.0.5:out");
  ASSERT_TRUE(tag.has_value());
  EXPECT_EQ(tag->direction, Direction::Outbound);
}

TEST(RuleTagTest, DecodeInvertsEncode) {
  RuleTag original{.ip = IP(172, 16, 0, 254), .direction = Direction::Outbound};
  auto decoded = DecodeTag(EncodeTag(original.ip, original.direction));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, original);
}

TEST(RuleTagTest, RejectsForeignAndMalformedComments) {
  EXPECT_FALSE(DecodeTag(""));
  EXPECT_FALSE(DecodeTag("allow ssh"));
  EXPECT_FALSE(DecodeTag("xx:10.0.0.5:in"));
  EXPECT_FALSE(DecodeTag("tm:10.0.0.5"));
  EXPECT_FALSE(DecodeTag("tm:10.0.0.5:up"));
  EXPECT_FALSE(DecodeTag("tm:10.0.0.5:in:extra"));
  EXPECT_FALSE(DecodeTag("tm:10.0.0:in"));
  EXPECT_FALSE(DecodeTag("tm:10.0.0.256:in"));
  EXPECT_FALSE(DecodeTag("tm:fe80::1:in"));
  EXPECT_FALSE(DecodeTag("TM:10.0.0.5:in"));
}

} // namespace
} // namespace trafficmon
