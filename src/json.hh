#pragma once

#include "str.hh"

namespace trafficmon {

// Appends `s` to `out` with the characters that JSON strings can't carry
// escaped. Quotes aren't added.
void EscapeJSONString(Str &out, StrView s);

} // namespace trafficmon
