#pragma once

#include <vector>

#include "int.hh"
#include "ip.hh"
#include "path.hh"
#include "status.hh"
#include "str.hh"

// Read-only view of the dnsmasq lease file.
//
// Each line has the form:
//
//   <expiry> <mac> <ip> <hostname> <client-id>
//
// for example:
//
//   1718000000 aa:bb:cc:dd:ee:ff 192.168.1.10 laptop 01:aa:bb:cc:dd:ee:ff
//
// Hostname is "*" when the client didn't send one. Lines that don't carry an
// IPv4 address in the third column (DHCPv6 leases, "duid" lines) are skipped.
namespace trafficmon {

struct Lease {
  I64 expiry = 0;
  Str mac; // lowercased, not validated
  IP ip;
  Str hostname;
};

struct LeaseTable {
  std::vector<Lease> leases;

  // First lease for the given address, or nullptr.
  const Lease *Find(IP) const;

  // Leased IPv4 addresses without duplicates, in ascending order.
  std::vector<IP> UniqueAddresses() const;
};

LeaseTable ParseLeases(StrView contents);

// Reports an error if the file can't be read.
LeaseTable ReadLeaseFile(const Path &, Status &);

} // namespace trafficmon
