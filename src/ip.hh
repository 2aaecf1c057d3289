#pragma once

#include <compare>
#include <functional>

#include "int.hh"
#include "str.hh"

namespace trafficmon {

union __attribute__((__packed__)) IP {
  U32 addr; // network byte order
  U8 bytes[4];
  IP() : addr(0) {}
  IP(U8 a, U8 b, U8 c, U8 d) : bytes{a, b, c, d} {}
  // Constructor for address in network byte order
  constexpr explicit IP(U32 addr) : addr(addr) {}

  // Host-order value, usable for ordering.
  U32 HostOrder() const {
    return (U32)bytes[0] << 24 | (U32)bytes[1] << 16 | (U32)bytes[2] << 8 |
           (U32)bytes[3];
  }
  auto operator<=>(const IP &other) const {
    return HostOrder() <=> other.HostOrder();
  }
  bool operator==(const IP &other) const { return addr == other.addr; }
  bool operator!=(const IP &other) const { return addr != other.addr; }

  // Accepts only the dotted-quad form: four decimal octets (0-255, at most
  // three digits each) and nothing else. On failure `this` is left unchanged.
  bool TryParse(StrView);
};

static_assert(sizeof(IP) == 4);

Str ToStr(IP);
static_assert(Stringer<IP>);

} // namespace trafficmon

template <> struct std::hash<trafficmon::IP> {
  std::size_t operator()(const trafficmon::IP &ip) const {
    return std::hash<trafficmon::U32>()(ip.addr);
  }
};
