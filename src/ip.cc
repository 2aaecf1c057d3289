#include "ip.hh"

#include "format.hh"

namespace trafficmon {

bool IP::TryParse(StrView s) {
  auto parts = Split(s, '.');
  if (parts.size() != 4) {
    return false;
  }
  U8 parsed[4];
  for (int i = 0; i < 4; ++i) {
    if (parts[i].size() > 3) {
      return false;
    }
    unsigned long long octet;
    if (!ParseU64(parts[i], octet) || octet > 255) {
      return false;
    }
    parsed[i] = octet;
  }
  for (int i = 0; i < 4; ++i) {
    bytes[i] = parsed[i];
  }
  return true;
}

Str ToStr(IP ip) {
  return f("%d.%d.%d.%d", ip.bytes[0], ip.bytes[1], ip.bytes[2], ip.bytes[3]);
}

} // namespace trafficmon
