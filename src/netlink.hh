#pragma once

#include <cstring>
#include <functional>
#include <linux/netlink.h>

#include "fd.hh"
#include "int.hh"
#include "status.hh"

namespace trafficmon {

// Netlink allows communication with the Linux kernel via a packet-oriented IPC.
//
// This class wraps the netlink socket and provides methods for sending and
// receiving messages. All calls are blocking.
//
// Users of this class should be intimately familiar with the netlink protocol.
// See: https://docs.kernel.org/userspace-api/netlink/intro.html.
struct Netlink {

  struct Attr;

  struct Attrs {
    struct iterator {
      Attr *attr;
      iterator &operator++() {
        // Malformed (too short) attributes still advance the iterator.
        Size step = attr->len < sizeof(Attr) ? sizeof(Attr) : attr->len;
        attr = (Attr *)((uintptr_t)attr + ((step + 3) & ~3));
        return *this;
      }
      bool operator!=(const iterator &other) const {
        return attr < other.attr;
      }
      Attr &operator*() const { return *attr; }
    };

    char *ptr;
    Size size;

    iterator begin() const { return {(Attr *)ptr}; }
    iterator end() const { return {(Attr *)(ptr + ((size + 3) & ~3))}; }
  };

  // C++ sibling of `struct nlattr` from <linux/netlink.h>.
  struct alignas(4) Attr {
    U16 len;       // Length includes the header but not the trailing padding!
    U16 type : 14; // Enum value (based on nlmsghdr.nlmsg_type)
    bool big_endian : 1;
    bool nested : 1;
    char payload[0]; // Helper for accessing the payload

    // Payload is stored immediately after Attr. Copying it to a different
    // place in memory would miss the payload.
    Attr(const Attr &) = delete;

    Size PayloadSize() const { return len - sizeof(*this); }
    StrView View() const { return {payload, PayloadSize()}; }

    // Reads the payload as T. Returns false (leaving `out` untouched) if the
    // payload size doesn't match.
    template <typename T> bool Get(T &out) const {
      if (PayloadSize() != sizeof(T)) {
        return false;
      }
      memcpy(&out, payload, sizeof(T));
      return true;
    }

    // Payload interpreted as a NUL-terminated string.
    StrView CStr() const {
      StrView view = View();
      if (auto nul = view.find('\0'); nul != StrView::npos) {
        view = view.substr(0, nul);
      }
      return view;
    }

    Attrs Unnest() {
      return Attrs{
          .ptr = payload,
          .size = PayloadSize(),
      };
    }
  };

  static_assert(sizeof(Attr) == 4, "Netlink::Attr must be 4 bytes");

  // The netlink socket.
  FD fd;

  // The sequence number of the next message to be sent.
  U32 seq = 1;

  int protocol = -1;

  // Establishes connection with the specified netlink protocol.
  //
  // See: #include <linux/netlink.h> for a list of protocols.
  Netlink(int protocol, Status &status);

  // Send a simple netlink message.
  //
  // The `msg.nlmsg_seq` will be updated with an incremented sequence number and
  // send in its own netlink packet.
  void Send(nlmsghdr &msg, Status &status);

  // Send an arbitrary sequence of bytes as a netlink message.
  //
  // This can be used to efficiently send multiple messages in a single batch.
  void SendRaw(StrView, Status &status);

  using ReceiveCallback = std::function<void(void *fixed_message, Attrs)>;

  // Receive one or more netlink messages.
  //
  // Each netlink message is composed of a header, a fixed-size struct & a
  // sequence of attributes. `fixed_message_size` tells where the attributes
  // start.
  //
  // The `callback` will be called once for each response message received. For
  // `DUMP` requests it may be called multiple times - once for each multipart
  // message.
  //
  // Messages with a type other than `expected_type` are reported as errors.
  //
  // This method will block so call it only if you expect a message.
  void Receive(U16 expected_type, Size fixed_message_size,
               ReceiveCallback callback, Status &status);

  // Waits for the NLMSG_ERROR message that acknowledges the last request.
  void ReceiveAck(Status &status);

  template <typename T>
  void ReceiveT(U16 expected_type, std::function<void(T &message, Attrs)> cb,
                Status &status) {
    Receive(
        expected_type, sizeof(T),
        [&](void *ptr, Attrs attrs) { cb(*(T *)ptr, attrs); }, status);
  }
};

} // namespace trafficmon
