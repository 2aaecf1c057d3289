#include "identity.hh"

#include <linux/netlink.h>
#include <memory>
#include <unordered_map>

#include "log.hh"
#include "mac.hh"
#include "netlink.hh"
#include "rtnetlink.hh"

namespace trafficmon {

// Lease files use "*" when the client didn't send a hostname.
static constexpr StrView kNoHostname = "*";

NeighborLookup KernelNeighborLookup() {
  using Table = std::unordered_map<IP, Str>;
  auto table = std::make_shared<std::optional<Table>>();
  return [table](IP ip) -> std::optional<Str> {
    if (!table->has_value()) {
      table->emplace();
      Status status;
      Netlink netlink_route(NETLINK_ROUTE, status);
      rtnetlink::GetNeighbors(
          netlink_route,
          [&](rtnetlink::Neighbor &neighbor) {
            DEBUG << "Neighbor " << neighbor;
            if (neighbor.mac) {
              (*table)->emplace(neighbor.ip, neighbor.mac->ToStr());
            }
          },
          status);
      if (!status.Ok()) {
        WARN << "Neighbor table unavailable: " << status;
      }
    }
    auto it = (*table)->find(ip);
    if (it == (*table)->end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

std::optional<DeviceIdentity> IdentityResolver::Resolve(IP ip) const {
  Str candidate;
  Str name;
  if (const Lease *lease = leases.Find(ip)) {
    candidate = lease->mac;
    if (!lease->hostname.empty() && lease->hostname != kNoHostname) {
      name = lease->hostname;
    }
  } else if (neighbors) {
    if (auto lladdr = neighbors(ip)) {
      candidate = ToLower(*lladdr);
    }
  }
  Str mac = CanonicalMAC(candidate);
  if (mac.empty()) {
    return std::nullopt;
  }
  if (name.empty()) {
    name = ToStr(ip);
  }
  return DeviceIdentity{.mac = std::move(mac), .name = std::move(name)};
}

} // namespace trafficmon
