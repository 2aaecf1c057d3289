#pragma once

#include "fd.hh"
#include "int.hh"
#include "message_bus.hh"
#include "status.hh"
#include "str.hh"

// Minimal MQTT 3.1.1 publisher.
//
// Supports only what a periodic reporter needs: a single connection with
// username & password, QoS 0 publishes (optionally retained) and a clean
// disconnect. Incoming messages are never expected - the client doesn't
// subscribe.
namespace trafficmon::mqtt {

struct Options {
  Str host;
  U16 port = 1883;
  Str username; // empty = no username
  Str password; // sent only together with a username
  Str client_id;
  U16 keep_alive_seconds = 60;
  int timeout_seconds = 10; // for connect, send & receive
};

enum PacketType : U8 {
  CONNECT = 1,
  CONNACK = 2,
  PUBLISH = 3,
  DISCONNECT = 14,
};

// Variable length encoding used in the fixed header (1-4 bytes).
Str EncodeRemainingLength(Size length);

// Length-prefixed UTF-8 string.
Str EncodeString(StrView);

Str ConnectPacket(const Options &);
Str PublishPacket(StrView topic, StrView payload, bool retained);
Str DisconnectPacket();

// Keep alive for a connection that stays silent for up to `idle_seconds`.
// Brokers drop clients after 1.5x the keep alive without any packet, so the
// result leaves a margin of 30 seconds on top of the idle time.
U16 KeepAliveFor(U64 idle_seconds);

// Human readable CONNACK return code.
const char *ConnackReturnCodeName(U8 code);

struct Client : MessageBus {
  FD fd;

  Client() = default;
  Client(const Client &) = delete;

  // Sends DISCONNECT when still connected.
  ~Client();

  bool Connected() const { return fd.fd >= 0; }

  // Opens a TCP connection to the broker & waits for its CONNACK.
  void Connect(const Options &, Status &);

  // QoS 0. Success means only that the packet was handed over to the kernel.
  void Publish(StrView topic, StrView payload, bool retained,
               Status &) override;

  void Disconnect(Status &);
};

} // namespace trafficmon::mqtt
