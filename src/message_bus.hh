#pragma once

#include "status.hh"
#include "str.hh"

namespace trafficmon {

// Topic-based publish/subscribe transport.
struct MessageBus {
  virtual ~MessageBus() = default;

  // Retained messages are kept by the broker & delivered to late subscribers.
  virtual void Publish(StrView topic, StrView payload, bool retained,
                       Status &) = 0;
};

} // namespace trafficmon
