#pragma once

#include <optional>

#include "str.hh"

namespace trafficmon {

// Direction of traffic, as seen from the monitored device.
enum class Direction {
  Inbound,  // to the device ("ip daddr <device>")
  Outbound, // from the device ("ip saddr <device>")
};

constexpr Direction kDirections[] = {Direction::Inbound, Direction::Outbound};

// "in" or "out". Used in rule tags, MQTT topics & state file names.
inline const char *DirectionName(Direction direction) {
  return direction == Direction::Inbound ? "in" : "out";
}

inline std::optional<Direction> ParseDirection(StrView name) {
  if (name == "in") {
    return Direction::Inbound;
  } else if (name == "out") {
    return Direction::Outbound;
  }
  return std::nullopt;
}

inline Str ToStr(Direction direction) { return DirectionName(direction); }

} // namespace trafficmon
