#include "calendar.hh"

namespace trafficmon {

static Str FormatLocal(time_t t, const char *format) {
  struct tm tm;
  localtime_r(&t, &tm);
  char buf[32];
  size_t n = strftime(buf, sizeof(buf), format, &tm);
  return Str(buf, n);
}

Str DayKey(time_t t) { return FormatLocal(t, "%Y-%m-%d"); }

Str WeekKey(time_t t) { return FormatLocal(t, "%G-W%V"); }

} // namespace trafficmon
