#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace trafficmon {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  int n = vsnprintf(NULL, 0, fmt, args) + 1;
  va_end(args);
  Str buf(n, '\0');
  vsnprintf(buf.data(), n, fmt, args2);
  va_end(args2);
  buf.resize(n - 1);
  return buf;
}

} // namespace trafficmon
