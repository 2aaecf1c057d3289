#include "mqtt.hh"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>

#include "format.hh"
#include "log.hh"

namespace trafficmon::mqtt {

// Protocol level of MQTT 3.1.1.
static constexpr U8 kProtocolLevel = 4;

static constexpr U8 kFlagUsername = 0x80;
static constexpr U8 kFlagPassword = 0x40;
static constexpr U8 kFlagCleanSession = 0x02;

static constexpr U8 kPublishRetain = 0x01;

// Remaining length can't be encoded in more than 4 bytes.
static constexpr Size kMaxRemainingLength = 268'435'455;

static void AppendU16(Str &out, U16 value) {
  out += (char)(value >> 8);
  out += (char)(value & 0xff);
}

Str EncodeRemainingLength(Size length) {
  Str out;
  do {
    U8 byte = length % 128;
    length /= 128;
    if (length > 0) {
      byte |= 0x80;
    }
    out += (char)byte;
  } while (length > 0);
  return out;
}

Str EncodeString(StrView s) {
  Str out;
  AppendU16(out, (U16)s.size());
  out += s;
  return out;
}

static Str Packet(U8 first_byte, StrView body) {
  Str out;
  out += (char)first_byte;
  out += EncodeRemainingLength(body.size());
  out += body;
  return out;
}

Str ConnectPacket(const Options &options) {
  U8 flags = kFlagCleanSession;
  if (!options.username.empty()) {
    flags |= kFlagUsername;
    if (!options.password.empty()) {
      flags |= kFlagPassword;
    }
  }
  Str body = EncodeString("MQTT");
  body += (char)kProtocolLevel;
  body += (char)flags;
  AppendU16(body, options.keep_alive_seconds);
  body += EncodeString(options.client_id);
  if (flags & kFlagUsername) {
    body += EncodeString(options.username);
  }
  if (flags & kFlagPassword) {
    body += EncodeString(options.password);
  }
  return Packet(CONNECT << 4, body);
}

Str PublishPacket(StrView topic, StrView payload, bool retained) {
  Str body = EncodeString(topic);
  body += payload;
  return Packet(PUBLISH << 4 | (retained ? kPublishRetain : 0), body);
}

Str DisconnectPacket() { return Packet(DISCONNECT << 4, {}); }

U16 KeepAliveFor(U64 idle_seconds) {
  U64 keep_alive = idle_seconds + 30;
  if (keep_alive < 60) {
    return 60;
  }
  // The field is 16 bits wide.
  if (keep_alive > 0xffff) {
    return 0xffff;
  }
  return keep_alive;
}

const char *ConnackReturnCodeName(U8 code) {
  switch (code) {
  case 0:
    return "Connection accepted";
  case 1:
    return "Unacceptable protocol version";
  case 2:
    return "Identifier rejected";
  case 3:
    return "Server unavailable";
  case 4:
    return "Bad user name or password";
  case 5:
    return "Not authorized";
  default:
    return "Unknown return code";
  }
}

Client::~Client() {
  if (Connected()) {
    Status status;
    Disconnect(status);
    if (!status.Ok()) {
      DEBUG << "MQTT disconnect failed: " << status;
    }
  }
}

static FD Dial(const Options &options, Status &status) {
  addrinfo hints = {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  Str port = ToStr((unsigned)options.port);
  int err = getaddrinfo(options.host.c_str(), port.c_str(), &hints, &result);
  if (err != 0) {
    AppendErrorMessage(status) += "getaddrinfo(" + options.host +
                                  ") failed: " + gai_strerror(err);
    return FD();
  }
  timeval timeout = {.tv_sec = options.timeout_seconds, .tv_usec = 0};
  FD fd;
  for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    fd.Close();
  }
  freeaddrinfo(result);
  if (fd < 0) {
    AppendErrorMessage(status) +=
        f("Couldn't connect to %s:%u", options.host.c_str(),
          (unsigned)options.port);
  }
  errno = 0;
  return fd;
}

void Client::Connect(const Options &options, Status &status) {
  fd = Dial(options, status);
  RETURN_ON_ERROR(status);

  fd.SendAll(ConnectPacket(options), status);
  if (!status.Ok()) {
    status() += "Couldn't send CONNECT";
    fd.Close();
    return;
  }

  // CONNACK is always exactly 4 bytes: type, length (2), flags, return code.
  Str connack = fd.ReceiveExactly(4, status);
  if (!status.Ok()) {
    status() += "Couldn't receive CONNACK";
    fd.Close();
    return;
  }
  if ((U8)connack[0] != CONNACK << 4 || connack[1] != 2) {
    AppendErrorMessage(status) += f("Unexpected reply to CONNECT: %02x %02x",
                                    (U8)connack[0], (U8)connack[1]);
    fd.Close();
    return;
  }
  U8 code = connack[3];
  if (code != 0) {
    AppendErrorMessage(status) += f("Broker refused the connection: %s (%u)",
                                    ConnackReturnCodeName(code), code);
    fd.Close();
    return;
  }
  DEBUG << "Connected to MQTT broker " << options.host << ":"
        << (unsigned)options.port;
}

void Client::Publish(StrView topic, StrView payload, bool retained,
                     Status &status) {
  if (!Connected()) {
    AppendErrorMessage(status) += "Not connected";
    return;
  }
  Size body_size = 2 + topic.size() + payload.size();
  if (topic.size() > 0xffff || body_size > kMaxRemainingLength) {
    AppendErrorMessage(status) += "Message too large";
    return;
  }
  fd.SendAll(PublishPacket(topic, payload, retained), status);
  if (!status.Ok()) {
    // The stream is no longer in sync with the broker.
    fd.Close();
  }
}

void Client::Disconnect(Status &status) {
  if (!Connected()) {
    return;
  }
  fd.SendAll(DisconnectPacket(), status);
  fd.Close();
}

} // namespace trafficmon::mqtt
