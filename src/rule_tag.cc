#include "rule_tag.hh"

namespace trafficmon {

Str EncodeTag(IP ip, Direction direction) {
  Str tag = kTagMarker;
  tag += kTagSeparator;
  tag += ToStr(ip);
  tag += kTagSeparator;
  tag += DirectionName(direction);
  return tag;
}

std::optional<RuleTag> DecodeTag(StrView comment) {
  auto fields = Split(comment, kTagSeparator);
  if (fields.size() != 3 || fields[0] != kTagMarker) {
    return std::nullopt;
  }
  RuleTag tag;
  if (!tag.ip.TryParse(fields[1])) {
    return std::nullopt;
  }
  auto direction = ParseDirection(fields[2]);
  if (!direction) {
    return std::nullopt;
  }
  tag.direction = *direction;
  return tag;
}

} // namespace trafficmon
