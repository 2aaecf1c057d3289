#pragma once

#include <functional>
#include <linux/neighbour.h>
#include <linux/rtnetlink.h>
#include <optional>

#include "ip.hh"
#include "mac.hh"
#include "netlink.hh"
#include "status.hh"
#include "str.hh"

// Utilities for interacting with the Linux neighbor (ARP) table.
//
// See `man 7 rtnetlink`.
namespace trafficmon::rtnetlink {

struct Neighbor {
  ndmsg ndm;
  IP ip;
  std::optional<MAC> mac; // Missing for INCOMPLETE & FAILED entries.
};

Str ToStr(const Neighbor &);
static_assert(Stringer<Neighbor>);

// Dumps the IPv4 neighbor table. Equivalent to `ip -4 neigh show`.
void GetNeighbors(Netlink &netlink_route,
                  std::function<void(Neighbor &)> callback, Status &status);

} // namespace trafficmon::rtnetlink
