#pragma once

#include "leases.hh"
#include "packet_filter.hh"
#include "status.hh"

// Keeps the counter rules in line with the DHCP leases.
//
// Every leased IPv4 address gets two owned rules (one per direction). Owned
// rules of addresses that are no longer leased are removed. Rules of other tools
// are never touched.
namespace trafficmon {

struct SyncReport {
  int added = 0;
  int deleted = 0;
  int kept = 0;
  int failed = 0; // individual add/delete operations that didn't succeed
};

// Makes sure that the table & chain exist. Doesn't modify existing objects.
void EnsureContainer(PacketFilter &, Status &);

// One reconciliation cycle.
//
// `leases` is nullptr when the lease file couldn't be read. In that case (and
// when the lease file holds no IPv4 addresses) only the container is ensured
// and no rules are added or removed.
//
// Failures to add or delete a single rule are logged and counted in the report.
// `status` is set only when the container can't be ensured or the rules can't
// be listed.
SyncReport SyncRules(PacketFilter &, const LeaseTable *leases, Status &);

} // namespace trafficmon
