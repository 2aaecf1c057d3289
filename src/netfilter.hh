#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "ip.hh"
#include "netlink.hh"
#include "status.hh"

// Utilities for interacting with the Linux Netfilter framework (nftables).
//
// See https://wiki.nftables.org/.
namespace trafficmon::netfilter {

enum class Family : U8 {
  UNSPEC = 0,
  INET = 1, // NFPROTO_INET, corresponds to the "inet" family
  IPv4 = 2, // NFPROTO_IPV4, corresponds to the "ip" family
};

// Parses "inet" or "ip".
std::optional<Family> ParseFamily(StrView);
const char *FamilyName(Family);

enum class Hook {
  PRE_ROUTING,
  LOCAL_IN,
  FORWARD,
  LOCAL_OUT,
  POST_ROUTING,
};

// Create a new nftables table. Succeeds if the table already exists.
void NewTable(Netlink &, Family, const char *name, Status &status);

// Returns true if the table exists. ENOENT is not reported as an error.
bool TableExists(Netlink &, Family, const char *name, Status &status);

// Create a new nftables chain. When `hook_priority` is set, the chain becomes
// a base chain of type "filter".
void NewChain(Netlink &, Family, const char *table_name, const char *chain_name,
              std::optional<std::pair<Hook, I32>> hook_priority,
              std::optional<bool> policy_accept, Status &status);

// Returns true if the chain exists. ENOENT is not reported as an error.
bool ChainExists(Netlink &, Family, const char *table_name,
                 const char *chain_name, Status &status);

// Create a new nftables rule.
//
// `expressions` is the payload of NFTA_RULE_EXPRESSIONS - a sequence of
// NFTA_LIST_ELEM attributes, for example built with `CounterRuleExpressions`.
// `comment` is stored in the rule userdata, the same way the `nft` tool stores
// `comment "..."`. It's skipped when empty.
void NewRule(Netlink &, Family, const char *table_name, const char *chain_name,
             StrView expressions, StrView comment, Status &status);

// Delete a rule identified by its kernel-assigned handle.
void DelRule(Netlink &, Family, const char *table_name, const char *chain_name,
             U64 handle, Status &status);

enum class AddressMatch {
  Source,      // ip saddr <ip>
  Destination, // ip daddr <ip>
};

// Expressions equivalent to:
//
//   [meta nfproto ipv4] ip saddr|daddr <ip> counter
//
// The nfproto check is only added for the "inet" family. The rule has no
// verdict so matching packets continue through the chain.
Str CounterRuleExpressions(Family, AddressMatch, IP);

// A rule as reported by the kernel. Only the fields needed for accounting are
// decoded.
struct Rule {
  U64 handle = 0;
  Str comment;
  std::optional<U64> bytes;   // from the first "counter" expression
  std::optional<U64> packets; // from the first "counter" expression
};

// Lists rules of the given chain, in the order the kernel returns them.
void GetRules(Netlink &, Family, const char *table_name,
              const char *chain_name, std::function<void(Rule &)> callback,
              Status &status);

} // namespace trafficmon::netfilter
