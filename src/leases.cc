#include "leases.hh"

#include <algorithm>
#include <charconv>

namespace trafficmon {

const Lease *LeaseTable::Find(IP ip) const {
  for (auto &lease : leases) {
    if (lease.ip == ip) {
      return &lease;
    }
  }
  return nullptr;
}

std::vector<IP> LeaseTable::UniqueAddresses() const {
  std::vector<IP> addresses;
  for (auto &lease : leases) {
    addresses.push_back(lease.ip);
  }
  std::sort(addresses.begin(), addresses.end());
  addresses.erase(std::unique(addresses.begin(), addresses.end()),
                  addresses.end());
  return addresses;
}

LeaseTable ParseLeases(StrView contents) {
  LeaseTable table;
  for (StrView line : Split(contents, '\n')) {
    auto fields = SplitWhitespace(line);
    if (fields.size() < 3) {
      continue;
    }
    Lease lease;
    if (!lease.ip.TryParse(fields[2])) {
      continue;
    }
    auto [ptr, ec] = std::from_chars(
        fields[0].data(), fields[0].data() + fields[0].size(), lease.expiry);
    if (ec != std::errc()) {
      lease.expiry = 0; // not needed for accounting
    }
    lease.mac = ToLower(fields[1]);
    if (fields.size() > 3) {
      lease.hostname = fields[3];
    }
    table.leases.push_back(std::move(lease));
  }
  return table;
}

LeaseTable ReadLeaseFile(const Path &path, Status &status) {
  Str contents = ReadFile(path, status);
  if (!status.Ok()) {
    status() += "Couldn't read the DHCP lease file";
    return {};
  }
  return ParseLeases(contents);
}

} // namespace trafficmon
