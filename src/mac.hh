#pragma once

#include <optional>

#include "int.hh"
#include "str.hh"

namespace trafficmon {

struct MAC {
  U8 bytes[6];
  MAC() : bytes{0, 0, 0, 0, 0, 0} {}
  MAC(U8 a, U8 b, U8 c, U8 d, U8 e, U8 f) : bytes{a, b, c, d, e, f} {}

  // Parses the canonical form: six two-digit hex octets separated by colons,
  // e.g. "aa:bb:cc:dd:ee:ff". Uppercase digits are accepted. Anything else
  // (dashes, missing leading zeros, extra characters) is rejected.
  static std::optional<MAC> Parse(StrView);

  // Lowercase canonical form.
  Str ToStr() const;

  auto operator<=>(const MAC &other) const = default;
};

// Returns the lowercase canonical form of `candidate` or an empty string when
// it's not a valid MAC.
Str CanonicalMAC(StrView candidate);

} // namespace trafficmon
