#pragma once

#include <optional>

#include "direction.hh"
#include "ip.hh"
#include "str.hh"

// Identity of a counter rule, stored in its comment.
//
// Tags look like "tm:192.168.1.10:in". Rules whose comment doesn't decode are
// not ours and are never touched, so the chain can be shared with other tools.
namespace trafficmon {

constexpr char kTagMarker[] = "tm";
constexpr char kTagSeparator = ':'; // never appears in a dotted-quad address

struct RuleTag {
  IP ip;
  Direction direction;

  bool operator==(const RuleTag &other) const {
    return ip == other.ip && direction == other.direction;
  }
};

Str EncodeTag(IP, Direction);

// Returns nullopt for comments of other tools and for malformed tags.
std::optional<RuleTag> DecodeTag(StrView comment);

} // namespace trafficmon
