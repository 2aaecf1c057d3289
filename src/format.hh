#pragma once

#include "int.hh"
#include "str.hh"

#if !__has_builtin(__builtin_dump_struct)
#include <typeinfo>
#endif

namespace trafficmon {

// printf-style formatting into a Str.
Str f(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-security"
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
inline void AppendPrintf(std::string &out, const char *format, auto... args) {
  int n = snprintf(nullptr, 0, format, args...) + 1;
  std::string buf(n, '\0');
  snprintf(buf.data(), n, format, args...);
  buf.resize(n - 1);
  out += buf;
}
#pragma GCC diagnostic pop

// Human readable dump of a (C) struct. Used for netlink error reports.
template <typename T> std::string dump_struct(const T &t) {
  std::string s;
#if __has_builtin(__builtin_dump_struct)
  __builtin_dump_struct(&t, AppendPrintf, s);
#else
#if __cpp_rtti
  s += typeid(T).name();
  s += ' ';
#endif
  for (Size i = 0; i < sizeof(T); ++i) {
    AppendPrintf(s, "%02x ", ((unsigned char *)&t)[i]);
  }
#endif
  return s;
}

} // namespace trafficmon
