#pragma once

#include <functional>
#include <optional>

#include "ip.hh"
#include "leases.hh"
#include "str.hh"

namespace trafficmon {

// Stable identity of a device. The MAC survives DHCP renewals, the IP doesn't.
struct DeviceIdentity {
  Str mac;  // canonical, lowercase "aa:bb:cc:dd:ee:ff"
  Str name; // lease hostname or the IP address
};

// Link-layer address bound to the given IP according to the neighbor (ARP)
// cache.
using NeighborLookup = std::function<std::optional<Str>(IP)>;

// Neighbor lookup backed by the kernel neighbor table. The table is dumped on
// first use and reused for the rest of the cycle. Failures are logged & behave
// like an empty table.
NeighborLookup KernelNeighborLookup();

struct IdentityResolver {
  const LeaseTable &leases;
  NeighborLookup neighbors;

  // The lease table is consulted first. The neighbor cache is used only for
  // addresses without a lease. MACs that aren't in the canonical form are
  // treated as missing.
  //
  // Returns nullopt when no valid MAC was found. Such addresses must be skipped.
  std::optional<DeviceIdentity> Resolve(IP) const;
};

} // namespace trafficmon
