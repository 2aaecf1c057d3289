#include "json.hh"

#include "format.hh"

namespace trafficmon {

void EscapeJSONString(Str &out, StrView s) {
  for (auto c : s) {
    switch (c) {
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    default:
      if ((unsigned char)c < 0x20) {
        out += f("\\u%04x", (unsigned)(unsigned char)c);
      } else {
        out += c;
      }
    }
  }
}

} // namespace trafficmon
