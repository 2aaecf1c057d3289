#include "netlink.hh"

#include <cerrno>
#include <linux/rtnetlink.h>
#include <string>
#include <sys/socket.h>

#include "format.hh"

namespace trafficmon {

static constexpr sockaddr_nl kKernelSockaddr{
    .nl_family = AF_NETLINK,
    .nl_pad = 0,
    .nl_pid = 0,
    .nl_groups = 0,
};

Netlink::Netlink(int protocol, Status &status) : protocol(protocol) {
  fd = socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, protocol);
  if (fd < 0) {
    status() += "socket(AF_NETLINK, SOCK_RAW, " + f("%x", protocol) + ")";
    return;
  }
  int sndbuf = 64 * 1024;
  if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf)) < 0) {
    status() += "setsockopt(SO_SNDBUF)";
    return;
  }
  int recvbuf = 1024 * 1024;
  if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &recvbuf, sizeof(recvbuf)) < 0) {
    status() += "setsockopt(SO_RCVBUF)";
    return;
  }
  int one = 1;
  if (setsockopt(fd, SOL_NETLINK, NETLINK_EXT_ACK, &one, sizeof(one)) < 0) {
    status() += "setsockopt(NETLINK_EXT_ACK)";
    return;
  }
  if (setsockopt(fd, SOL_NETLINK, NETLINK_CAP_ACK, &one, sizeof(one)) < 0) {
    status() += "setsockopt(NETLINK_CAP_ACK)";
    return;
  }
  sockaddr_nl local = {
      .nl_family = AF_NETLINK,
      .nl_pad = 0,
      .nl_pid = 0,
      .nl_groups = 0,
  };
  if (bind(fd, (sockaddr *)&local, sizeof(local)) < 0) {
    status() += "bind(AF_NETLINK)";
    return;
  }
}

void Netlink::Send(nlmsghdr &msg, Status &status) {
  msg.nlmsg_seq = seq++;
  SendRaw(StrView((char *)&msg, msg.nlmsg_len), status);
}

void Netlink::SendRaw(StrView raw, Status &status) {
  SSize len = sendto(fd, raw.data(), raw.size(), 0,
                     (sockaddr *)&kKernelSockaddr, sizeof(kKernelSockaddr));
  if (len < 0) {
    status() += "sendto(AF_NETLINK)";
    return;
  }
}

void Netlink::ReceiveAck(Status &status) {
  Receive(
      NLMSG_ERROR, 0, [](void *, Attrs) {}, status);
}

void Netlink::Receive(U16 expected_type, Size fixed_message_size,
                      ReceiveCallback callback, Status &status) {
  bool expect_more_messages = true;
  while (expect_more_messages) {
    SSize peek_len = recv(fd, nullptr, 0, MSG_PEEK | MSG_TRUNC);
    if (peek_len < 0) {
      if (errno == EINTR) {
        continue;
      }
      status() += "recv(AF_NETLINK, MSG_PEEK)";
      return;
    }
    Str buf_storage(peek_len, '\0');
    char *buf = buf_storage.data();
    SSize len = recv(fd, buf, buf_storage.size(), 0);
    if (len < 0) {
      status() += "recv(AF_NETLINK)";
      return;
    }

    char *buf_iter = buf;
    char *buf_end = buf + len;

    while (buf_iter + sizeof(nlmsghdr) <= buf_end) {
      nlmsghdr *hdr = (nlmsghdr *)(buf_iter);
      char *msg_end = buf_iter + hdr->nlmsg_len;
      if (hdr->nlmsg_len < sizeof(nlmsghdr) || msg_end > buf_end) {
        status() += "Truncated Netlink message, msg_len=" +
                    std::to_string(hdr->nlmsg_len) +
                    ", buf_size=" + std::to_string(len);
        return;
      }
      char *payload = buf_iter + sizeof(nlmsghdr);
      buf_iter += NLMSG_ALIGN(hdr->nlmsg_len);

      if (hdr->nlmsg_type == NLMSG_ERROR) {
        nlmsgerr *err = (nlmsgerr *)payload;
        if (err->error == 0) {
          return; // This was a regular ACK - ignore it
        }
        Str msg = "Netlink error";
        msg += "\nOriginal request:\n";
        msg += dump_struct(err->msg);

        if (hdr->nlmsg_flags & NLM_F_ACK_TLVS) {
          // With NETLINK_CAP_ACK only the header of the original request is
          // echoed back, so the TLVs start right after it.
          char *tlv = payload + sizeof(nlmsgerr);
          while (tlv + sizeof(nlattr) <= msg_end) {
            nlattr *a = (nlattr *)tlv;
            if (a->nla_len < sizeof(nlattr)) {
              break;
            }
            if (a->nla_type == NLMSGERR_ATTR_MSG) {
              msg += " error message: \"";
              msg += StrView((char *)(a + 1), a->nla_len - sizeof(nlattr))
                         .substr(0, strnlen((char *)(a + 1),
                                            a->nla_len - sizeof(nlattr)));
              msg += "\"";
            } else if (a->nla_type == NLMSGERR_ATTR_OFFS) {
              msg += " error offset: ";
              msg += std::to_string(*(U32 *)(a + 1));
            }
            tlv += NLA_ALIGN(a->nla_len);
          }
        }

        errno = -err->error;
        status() += msg;
        return;
      } else if (hdr->nlmsg_type == NLMSG_DONE) {
        return;
      } else {
        if ((hdr->nlmsg_flags & NLM_F_MULTI) == 0) {
          expect_more_messages = false;
        }
        if (hdr->nlmsg_type != expected_type) {
          status() += f("Expected netlink message type 0x%x, got 0x%x",
                        expected_type, hdr->nlmsg_type);
          return;
        }
        char *attrs_begin = payload + NLMSG_ALIGN(fixed_message_size);
        if (attrs_begin > msg_end) {
          status() += "Netlink message shorter than its fixed header";
          return;
        }
        Attrs attrs{
            .ptr = attrs_begin,
            .size = static_cast<Size>(msg_end - attrs_begin),
        };
        callback(payload, attrs);
      }
    } // while (buf_iter + sizeof(nlmsghdr) <= buf_end)

    if (buf_iter < buf_end) {
      status() +=
          "Extra data at the end of netlink recv buffer. Message type is " +
          f("0x%x", ((nlmsghdr *)buf)->nlmsg_type);
      return; // Parsing error - don't progress further to avoid more noise
    }
  } // while (expect_more_messages)
}

} // namespace trafficmon
