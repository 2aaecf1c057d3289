#pragma once

#include <set>
#include <vector>

#include "message_bus.hh"

namespace trafficmon {

struct FakeMessageBus : MessageBus {
  struct Message {
    Str topic;
    Str payload;
    bool retained;
  };
  std::vector<Message> messages;
  std::set<Str> failing_topics;

  void Publish(StrView topic, StrView payload, bool retained,
               Status &status) override {
    if (failing_topics.contains(Str(topic))) {
      AppendErrorMessage(status) += "Connection refused";
      return;
    }
    messages.push_back(
        Message{.topic = Str(topic), .payload = Str(payload), .retained = retained});
  }

  int CountRetained() const {
    int n = 0;
    for (auto &message : messages) {
      n += message.retained;
    }
    return n;
  }
};

} // namespace trafficmon
