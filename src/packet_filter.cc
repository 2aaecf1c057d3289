#include "packet_filter.hh"

#include <linux/netlink.h>

namespace trafficmon {

using namespace netfilter;

NftablesFilter::NftablesFilter(Family family, Str table, Str chain,
                               Status &status)
    : netlink(NETLINK_NETFILTER, status), family(family),
      table(std::move(table)), chain(std::move(chain)) {
  if (!status.Ok()) {
    status() += "Couldn't establish netlink to Netfilter";
  }
}

bool NftablesFilter::TableExists(Status &status) {
  return netfilter::TableExists(netlink, family, table.c_str(), status);
}

void NftablesFilter::CreateTable(Status &status) {
  NewTable(netlink, family, table.c_str(), status);
}

bool NftablesFilter::ChainExists(Status &status) {
  return netfilter::ChainExists(netlink, family, table.c_str(), chain.c_str(),
                                status);
}

void NftablesFilter::CreateChain(Status &status) {
  NewChain(netlink, family, table.c_str(), chain.c_str(),
           std::make_pair(Hook::FORWARD, 0), true, status);
}

std::vector<Rule> NftablesFilter::ListRules(Status &status) {
  std::vector<Rule> rules;
  GetRules(
      netlink, family, table.c_str(), chain.c_str(),
      [&](Rule &rule) { rules.push_back(std::move(rule)); }, status);
  return rules;
}

void NftablesFilter::AddCounterRule(IP ip, Direction direction, StrView tag,
                                    Status &status) {
  AddressMatch match = direction == Direction::Outbound
                           ? AddressMatch::Source
                           : AddressMatch::Destination;
  NewRule(netlink, family, table.c_str(), chain.c_str(),
          CounterRuleExpressions(family, match, ip), tag, status);
}

void NftablesFilter::DeleteRule(U64 handle, Status &status) {
  DelRule(netlink, family, table.c_str(), chain.c_str(), handle, status);
}

Str NftablesFilter::Name() const {
  return Str(FamilyName(family)) + " " + table + " " + chain;
}

} // namespace trafficmon
