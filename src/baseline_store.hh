#pragma once

#include <optional>

#include "direction.hh"
#include "int.hh"
#include "path.hh"
#include "status.hh"
#include "str.hh"

namespace trafficmon {

// Persistent per-(MAC, direction) state of the traffic engine.
//
// Counters are reset together with the nftables rules on reboot, so the store
// is expected to live on tmpfs and reset at the same time.
struct BaselineRecord {
  U64 bw_bytes = 0;   // counter value at the previous publish
  I64 bw_ts = 0;      // unix time of the previous publish
  U64 day_bytes = 0;  // counter value at the start of `day_date`
  Str day_date;       // "YYYY-MM-DD" or empty
  U64 week_bytes = 0; // counter value at the start of `week_num`
  Str week_num;       // "YYYY-Www" or empty

  // "key=value" lines.
  Str Serialize() const;

  // Unknown keys are ignored. Missing keys keep their default values. A
  // malformed number is an error.
  static BaselineRecord Parse(StrView, Status &);
};

// One file per record: "<dir>/<mac with '_' instead of ':'>_<direction>".
struct BaselineStore {
  Path dir;

  explicit BaselineStore(Path dir) : dir(std::move(dir)) {}

  Path RecordPath(StrView mac, Direction) const;

  // Returns nullopt when there is no record yet. `status` is set only for
  // unreadable or malformed records.
  std::optional<BaselineRecord> Load(StrView mac, Direction, Status &) const;

  // Creates `dir` when needed and atomically replaces the record.
  void Save(StrView mac, Direction, const BaselineRecord &, Status &) const;
};

} // namespace trafficmon
