#pragma once

#include <optional>
#include <vector>

#include "packet_filter.hh"
#include "rule_tag.hh"
#include "status.hh"

namespace trafficmon {

// A counter rule created by us - its comment decodes as a tag.
struct OwnedRule {
  RuleTag tag;
  U64 handle = 0;
  std::optional<U64> bytes;
  std::optional<U64> packets;
};

// Cumulative counters of one owned rule at the moment of listing.
struct CounterSample {
  IP ip;
  Direction direction;
  U64 bytes = 0;
  U64 packets = 0;
};

// Owned rules of the chain, in listing order. Rules of other tools are
// skipped.
std::vector<OwnedRule> ListOwnedRules(PacketFilter &, Status &);

// Counters of all owned rules, in listing order. An owned rule without a
// readable counter is dropped with a warning so it can't hide the other
// devices.
std::vector<CounterSample> ReadCounters(PacketFilter &, Status &);

} // namespace trafficmon
