#include "rtnetlink.hh"

#include <sys/socket.h>

namespace trafficmon::rtnetlink {

void GetNeighbors(Netlink &netlink_route,
                  std::function<void(Neighbor &)> callback, Status &status) {
  if (!status.Ok()) {
    return;
  }
  struct {
    nlmsghdr hdr{.nlmsg_len = sizeof(*this),
                 .nlmsg_type = RTM_GETNEIGH,
                 .nlmsg_flags = NLM_F_DUMP | NLM_F_REQUEST,
                 .nlmsg_seq = 0,
                 .nlmsg_pid = 0};
    ndmsg msg{
        .ndm_family = AF_INET,
        .ndm_pad1 = 0,
        .ndm_pad2 = 0,
        .ndm_ifindex = 0,
        .ndm_state = 0,
        .ndm_flags = 0,
        .ndm_type = 0,
    };
  } req;
  netlink_route.Send(req.hdr, status);
  if (!status.Ok()) {
    status() += "Couldn't request the neighbor table";
    return;
  }
  netlink_route.ReceiveT<ndmsg>(
      RTM_NEWNEIGH,
      [&](ndmsg &ndm, Netlink::Attrs attrs) {
        if (ndm.ndm_family != AF_INET) {
          return;
        }
        Neighbor neighbor = {};
        neighbor.ndm = ndm;
        bool has_ip = false;
        for (auto &attr : attrs) {
          switch (attr.type) {
          case NDA_DST: {
            U32 addr;
            if (attr.Get(addr)) {
              neighbor.ip = IP(addr);
              has_ip = true;
            }
            break;
          }
          case NDA_LLADDR:
            if (attr.PayloadSize() == 6) {
              MAC mac;
              memcpy(mac.bytes, attr.payload, 6);
              neighbor.mac = mac;
            }
            break;
          }
        }
        if (has_ip) {
          callback(neighbor);
        }
      },
      status);
  if (!status.Ok()) {
    status() += "Couldn't read the neighbor table";
  }
}

Str ToStr(const Neighbor &n) {
  return "Neighbor{ip=" + trafficmon::ToStr(n.ip) +
         ", mac=" + (n.mac ? n.mac->ToStr() : "none") +
         ", state=" + trafficmon::ToStr((unsigned)n.ndm.ndm_state) + "}";
}

} // namespace trafficmon::rtnetlink
