#pragma once

#include <set>

#include "message_bus.hh"
#include "traffic_engine.hh"

// Home Assistant MQTT discovery & state messages.
//
// Every device gets one sensor per direction & metric. Sensors of a device are
// grouped under a Home Assistant device identified by its MAC address, so they
// survive IP changes.
namespace trafficmon {

enum class Metric { Bytes, Bandwidth, Daily, Weekly };

constexpr Metric kMetrics[] = {Metric::Bytes, Metric::Bandwidth, Metric::Daily,
                               Metric::Weekly};

// Key of the metric in the state payload ("bytes", "bw", "daily", "weekly").
const char *MetricKey(Metric);

struct Topics {
  Str base;      // state topics live under "<base>/<mac>/<dir>"
  Str discovery; // discovery prefix of Home Assistant

  Str State(StrView mac, Direction) const;
  Str DiscoveryConfig(StrView mac, Direction, Metric) const;
};

// "aa_bb_cc_dd_ee_ff", usable in object ids.
Str MACId(StrView mac);

Str DiscoveryPayload(const Topics &, StrView mac, StrView name, Direction,
                     Metric);

Str StatePayload(const TrafficReport &);

// Publishes reports of a single run.
//
// Discovery configs are published (retained) the first time a MAC is seen in
// the run. State messages are not retained. Failed publishes are logged and
// skipped.
struct Publisher {
  MessageBus &bus;
  Topics topics;
  std::set<Str> seen; // MACs whose discovery was already sent

  // Returns true when the state message was accepted by the bus.
  bool Publish(const TrafficReport &);

private:
  void PublishDiscovery(StrView mac, StrView name);
  bool Send(StrView topic, StrView payload, bool retained);
};

} // namespace trafficmon
