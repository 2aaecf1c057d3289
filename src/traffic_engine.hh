#pragma once

#include <ctime>
#include <functional>
#include <optional>
#include <vector>

#include "baseline_store.hh"
#include "counters.hh"
#include "identity.hh"
#include "packet_filter.hh"
#include "status.hh"

// Turns cumulative nftables counters into bandwidth & per-period usage.
namespace trafficmon {

struct BandwidthSample {
  IP ip;
  Direction direction;
  U64 bytes = 0;     // from the second snapshot
  U64 packets = 0;   // from the second snapshot
  U64 bandwidth = 0; // bytes per second
};

// Joins the snapshots on (ip, direction). Entries missing from `first` are
// treated as if they started at 0. Counters that went down (rule re-created)
// give 0 bandwidth. The result follows the order of `second`.
std::vector<BandwidthSample>
ComputeBandwidth(const std::vector<CounterSample> &first,
                 const std::vector<CounterSample> &second,
                 U64 interval_seconds);

struct PeriodUsage {
  U64 daily = 0;
  U64 weekly = 0;
};

// Moves the record to the current day & week and returns the usage within them.
//
// A counter lower than the stored period start means that the counter was
// reset. The period starts again from the current value.
PeriodUsage UpdateBaseline(BaselineRecord &, U64 bytes_now, time_t now,
                           StrView day_key, StrView week_key);

// Everything that is published about one device & direction.
struct TrafficReport {
  IP ip;
  Str mac;
  Str name;
  Direction direction;
  U64 bytes = 0;
  U64 packets = 0;
  U64 bandwidth = 0;
  U64 daily = 0;
  U64 weekly = 0;
  time_t timestamp = 0;
};

struct TrafficEngine {
  using Sleeper = std::function<void(U64 seconds)>;
  using Clock = std::function<time_t()>;

  PacketFilter &filter;
  const IdentityResolver &identity;
  const BaselineStore &store;
  U64 interval_seconds;
  std::optional<IP> skip_ip; // the broker doesn't need to see itself
  Sleeper sleep;
  Clock clock;

  // Takes two counter snapshots `interval_seconds` apart and updates the
  // baselines of every device that could be identified.
  //
  // Only entries whose baseline was persisted are returned. `matched` is set to
  // the number of owned counters in the second snapshot. When the first
  // snapshot is empty the function returns immediately without sleeping, so
  // rules created during the wait are picked up only by the next run.
  std::vector<TrafficReport> Run(int &matched, Status &);
};

// Blocks the calling thread.
void SleepSeconds(U64 seconds);

} // namespace trafficmon
