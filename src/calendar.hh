#pragma once

#include <ctime>

#include "str.hh"

// Period keys used for the daily & weekly usage. Both use the local time zone
// of the router.
namespace trafficmon {

// "YYYY-MM-DD"
Str DayKey(time_t);

// ISO-8601 week, e.g. "2024-W23". Weeks start on Monday. The year is the ISO
// week-based year, which differs from the calendar year around New Year.
Str WeekKey(time_t);

} // namespace trafficmon
