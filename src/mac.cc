#include "mac.hh"

#include "format.hh"

namespace trafficmon {

static int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::optional<MAC> MAC::Parse(StrView s) {
  if (s.size() != 17) {
    return std::nullopt;
  }
  MAC mac;
  for (int i = 0; i < 6; ++i) {
    int hi = HexDigit(s[i * 3]);
    int lo = HexDigit(s[i * 3 + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    if (i < 5 && s[i * 3 + 2] != ':') {
      return std::nullopt;
    }
    mac.bytes[i] = hi << 4 | lo;
  }
  return mac;
}

Str MAC::ToStr() const {
  return f("%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1], bytes[2],
           bytes[3], bytes[4], bytes[5]);
}

Str CanonicalMAC(StrView candidate) {
  if (auto mac = MAC::Parse(candidate)) {
    return mac->ToStr();
  }
  return "";
}

} // namespace trafficmon
