#pragma once

#include <vector>

#include "direction.hh"
#include "ip.hh"
#include "netfilter.hh"
#include "netlink.hh"
#include "status.hh"
#include "str.hh"

namespace trafficmon {

// The table & chain that hold the counter rules, seen as a typed interface.
//
// Rule handles are assigned by the kernel. They are valid only until the next
// modification of the chain, so callers should use them within the cycle that
// listed them.
struct PacketFilter {
  virtual ~PacketFilter() = default;

  virtual bool TableExists(Status &) = 0;
  virtual void CreateTable(Status &) = 0;
  virtual bool ChainExists(Status &) = 0;

  // Creates a base chain of type filter, on the forward hook, priority 0, with
  // the accept policy.
  virtual void CreateChain(Status &) = 0;

  // All rules of the chain, in kernel order. Rules of other tools included.
  virtual std::vector<netfilter::Rule> ListRules(Status &) = 0;

  // Appends "ip saddr|daddr <ip> counter comment <tag>". Outbound traffic is
  // matched by source address, inbound by destination address.
  virtual void AddCounterRule(IP, Direction, StrView tag, Status &) = 0;

  virtual void DeleteRule(U64 handle, Status &) = 0;

  // "family table chain", for log messages.
  virtual Str Name() const = 0;
};

// PacketFilter backed by nftables, spoken directly over NETLINK_NETFILTER.
struct NftablesFilter : PacketFilter {
  Netlink netlink;
  netfilter::Family family;
  Str table;
  Str chain;

  NftablesFilter(netfilter::Family, Str table, Str chain, Status &);

  bool TableExists(Status &) override;
  void CreateTable(Status &) override;
  bool ChainExists(Status &) override;
  void CreateChain(Status &) override;
  std::vector<netfilter::Rule> ListRules(Status &) override;
  void AddCounterRule(IP, Direction, StrView tag, Status &) override;
  void DeleteRule(U64 handle, Status &) override;
  Str Name() const override;
};

} // namespace trafficmon
