#include "counters.hh"

#include "log.hh"

namespace trafficmon {

std::vector<OwnedRule> ListOwnedRules(PacketFilter &filter, Status &status) {
  std::vector<OwnedRule> owned;
  auto rules = filter.ListRules(status);
  if (!status.Ok()) {
    return owned;
  }
  for (auto &rule : rules) {
    auto tag = DecodeTag(rule.comment);
    if (!tag) {
      continue;
    }
    owned.push_back(OwnedRule{
        .tag = *tag,
        .handle = rule.handle,
        .bytes = rule.bytes,
        .packets = rule.packets,
    });
  }
  return owned;
}

std::vector<CounterSample> ReadCounters(PacketFilter &filter, Status &status) {
  std::vector<CounterSample> samples;
  auto owned = ListOwnedRules(filter, status);
  if (!status.Ok()) {
    return samples;
  }
  for (auto &rule : owned) {
    if (!rule.bytes || !rule.packets) {
      WARN << "Rule " << EncodeTag(rule.tag.ip, rule.tag.direction)
           << " (handle " << rule.handle
           << ") has no readable counter. Skipping it.";
      continue;
    }
    samples.push_back(CounterSample{
        .ip = rule.tag.ip,
        .direction = rule.tag.direction,
        .bytes = *rule.bytes,
        .packets = *rule.packets,
    });
  }
  return samples;
}

} // namespace trafficmon
