#include "netfilter.hh"

#include <arpa/inet.h>
#include <cerrno>
#include <endian.h>
#include <linux/netfilter.h>
#include <linux/netfilter/nf_tables.h>
#include <linux/netfilter/nfnetlink.h>
#include <sys/socket.h>

#include "buffer_builder.hh"
#include "format.hh"

namespace trafficmon::netfilter {

// Type of the userdata TLV that holds the rule comment. This is how `nft`
// (libnftnl) stores `comment "..."`, so comments are visible in
// `nft list ruleset`.
static constexpr U8 kUserdataComment = 0;

std::optional<Family> ParseFamily(StrView name) {
  if (name == "inet") {
    return Family::INET;
  } else if (name == "ip") {
    return Family::IPv4;
  }
  return std::nullopt;
}

const char *FamilyName(Family family) {
  switch (family) {
  case Family::INET:
    return "inet";
  case Family::IPv4:
    return "ip";
  default:
    return "unspec";
  }
}

static constexpr U16 NftType(U16 msg) {
  return (NFNL_SUBSYS_NFTABLES << 8) | msg;
}

// Appends a netlink message with nfgenmsg header. Attributes are appended by
// `fill`. The message length is patched once `fill` returns.
static void AppendMessage(BufferBuilder &b, U16 type, U16 flags, U32 seq,
                          Family family,
                          const std::function<void(BufferBuilder &)> &fill) {
  b.AlignTo<NLMSG_ALIGNTO>();
  auto hdr = b.AppendPrimitive(nlmsghdr{
      .nlmsg_len = 0,
      .nlmsg_type = type,
      .nlmsg_flags = flags,
      .nlmsg_seq = seq,
      .nlmsg_pid = 0,
  });
  Size start = hdr.offset;
  b.AppendPrimitive(nfgenmsg{
      .nfgen_family = (U8)family,
      .version = NFNETLINK_V0,
      .res_id = 0,
  });
  fill(b);
  b.AlignTo<NLMSG_ALIGNTO>();
  hdr->nlmsg_len = b.Length() - start;
}

static void AppendBatchMarker(BufferBuilder &b, U16 type, U32 seq) {
  b.AlignTo<NLMSG_ALIGNTO>();
  b.AppendPrimitive(nlmsghdr{
      .nlmsg_len = NLMSG_LENGTH(sizeof(nfgenmsg)),
      .nlmsg_type = type,
      .nlmsg_flags = NLM_F_REQUEST,
      .nlmsg_seq = seq,
      .nlmsg_pid = 0,
  });
  b.AppendPrimitive(nfgenmsg{
      .nfgen_family = AF_UNSPEC,
      .version = NFNETLINK_V0,
      .res_id = htons(NFNL_SUBSYS_NFTABLES),
  });
}

// nftables only accepts modifications wrapped in a batch. Sends a batch with a
// single message & waits for its acknowledgement.
static void Transaction(Netlink &netlink, U16 type, U16 flags, Family family,
                        const std::function<void(BufferBuilder &)> &fill,
                        Status &status) {
  BufferBuilder b(512);
  AppendBatchMarker(b, NFNL_MSG_BATCH_BEGIN, netlink.seq++);
  AppendMessage(b, type, flags | NLM_F_REQUEST | NLM_F_ACK, netlink.seq++,
                family, fill);
  AppendBatchMarker(b, NFNL_MSG_BATCH_END, netlink.seq++);
  netlink.SendRaw(b.buffer, status);
  if (!status.Ok()) {
    return;
  }
  netlink.ReceiveAck(status);
}

// Sends a GET request for a single object. Returns false if the kernel says
// that it doesn't exist.
static bool Exists(Netlink &netlink, U16 get_type, U16 reply_type,
                   Family family,
                   const std::function<void(BufferBuilder &)> &fill,
                   Status &status) {
  BufferBuilder b(256);
  AppendMessage(b, get_type, NLM_F_REQUEST, netlink.seq++, family, fill);
  netlink.SendRaw(b.buffer, status);
  if (!status.Ok()) {
    return false;
  }
  bool found = false;
  Status query_status;
  netlink.Receive(
      reply_type, sizeof(nfgenmsg),
      [&](void *, Netlink::Attrs) { found = true; }, query_status);
  if (!query_status.Ok()) {
    if (query_status.errsv == ENOENT) {
      return false;
    }
    status = std::move(query_status);
    return false;
  }
  return found;
}

void NewTable(Netlink &netlink, Family family, const char *name,
              Status &status) {
  Transaction(
      netlink, NftType(NFT_MSG_NEWTABLE), NLM_F_CREATE, family,
      [&](BufferBuilder &b) { b.AppendAttrCStr(NFTA_TABLE_NAME, name); },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't create Netfilter table \"%s\"", name);
  }
}

bool TableExists(Netlink &netlink, Family family, const char *name,
                 Status &status) {
  bool exists = Exists(
      netlink, NftType(NFT_MSG_GETTABLE), NftType(NFT_MSG_NEWTABLE), family,
      [&](BufferBuilder &b) { b.AppendAttrCStr(NFTA_TABLE_NAME, name); },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't look up Netfilter table \"%s\"", name);
  }
  return exists;
}

void NewChain(Netlink &netlink, Family family, const char *table_name,
              const char *chain_name,
              std::optional<std::pair<Hook, I32>> hook_priority,
              std::optional<bool> policy_accept, Status &status) {
  Transaction(
      netlink, NftType(NFT_MSG_NEWCHAIN), NLM_F_CREATE, family,
      [&](BufferBuilder &b) {
        b.AppendAttrCStr(NFTA_CHAIN_TABLE, table_name);
        b.AppendAttrCStr(NFTA_CHAIN_NAME, chain_name);
        if (hook_priority.has_value()) {
          Size hook = b.BeginNested(NFTA_CHAIN_HOOK);
          b.AppendAttrT<U32>(NFTA_HOOK_HOOKNUM,
                             htonl((U32)hook_priority->first));
          b.AppendAttrT<U32>(NFTA_HOOK_PRIORITY,
                             htonl((U32)hook_priority->second));
          b.EndAttr(hook);
          b.AppendAttrCStr(NFTA_CHAIN_TYPE, "filter");
        }
        if (policy_accept.has_value()) {
          U32 policy = *policy_accept ? NF_ACCEPT : NF_DROP;
          b.AppendAttrT<U32>(NFTA_CHAIN_POLICY, htonl(policy));
        }
      },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't create chain \"%s\" in table \"%s\"", chain_name,
                  table_name);
  }
}

bool ChainExists(Netlink &netlink, Family family, const char *table_name,
                 const char *chain_name, Status &status) {
  bool exists = Exists(
      netlink, NftType(NFT_MSG_GETCHAIN), NftType(NFT_MSG_NEWCHAIN), family,
      [&](BufferBuilder &b) {
        b.AppendAttrCStr(NFTA_CHAIN_TABLE, table_name);
        b.AppendAttrCStr(NFTA_CHAIN_NAME, chain_name);
      },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't look up chain \"%s\" in table \"%s\"", chain_name,
                  table_name);
  }
  return exists;
}

void NewRule(Netlink &netlink, Family family, const char *table_name,
             const char *chain_name, StrView expressions, StrView comment,
             Status &status) {
  Transaction(
      netlink, NftType(NFT_MSG_NEWRULE), NLM_F_CREATE | NLM_F_APPEND, family,
      [&](BufferBuilder &b) {
        b.AppendAttrCStr(NFTA_RULE_TABLE, table_name);
        b.AppendAttrCStr(NFTA_RULE_CHAIN, chain_name);
        Size exprs = b.BeginNested(NFTA_RULE_EXPRESSIONS);
        b.AppendBytes(expressions);
        b.EndAttr(exprs);
        if (!comment.empty()) {
          Str userdata;
          userdata += (char)kUserdataComment;
          userdata += (char)(comment.size() + 1);
          userdata += comment;
          userdata += '\0';
          b.AppendAttr(NFTA_RULE_USERDATA, userdata);
        }
      },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't create a new rule in table \"%s\" chain \"%s\"",
                  table_name, chain_name);
  }
}

void DelRule(Netlink &netlink, Family family, const char *table_name,
             const char *chain_name, U64 handle, Status &status) {
  Transaction(
      netlink, NftType(NFT_MSG_DELRULE), 0, family,
      [&](BufferBuilder &b) {
        b.AppendAttrCStr(NFTA_RULE_TABLE, table_name);
        b.AppendAttrCStr(NFTA_RULE_CHAIN, chain_name);
        b.AppendAttrT<U64>(NFTA_RULE_HANDLE, htobe64(handle));
      },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't delete rule %llu from table \"%s\" chain \"%s\"",
                  handle, table_name, chain_name);
  }
}

// Appends a single NFTA_LIST_ELEM with the given expression name. The
// expression attributes are appended by `data`.
static void AppendExpression(BufferBuilder &b, const char *name,
                             const std::function<void(BufferBuilder &)> &data) {
  Size elem = b.BeginNested(NFTA_LIST_ELEM);
  b.AppendAttrCStr(NFTA_EXPR_NAME, name);
  Size expr_data = b.BeginNested(NFTA_EXPR_DATA);
  data(b);
  b.EndAttr(expr_data);
  b.EndAttr(elem);
}

static void AppendCmpEq(BufferBuilder &b, StrView value) {
  AppendExpression(b, "cmp", [&](BufferBuilder &b) {
    b.AppendAttrT<U32>(NFTA_CMP_SREG, htonl(NFT_REG_1));
    b.AppendAttrT<U32>(NFTA_CMP_OP, htonl(NFT_CMP_EQ));
    Size cmp_data = b.BeginNested(NFTA_CMP_DATA);
    b.AppendAttr(NFTA_DATA_VALUE, value);
    b.EndAttr(cmp_data);
  });
}

Str CounterRuleExpressions(Family family, AddressMatch match, IP ip) {
  BufferBuilder b(256);
  if (family == Family::INET) {
    // meta nfproto ipv4
    AppendExpression(b, "meta", [](BufferBuilder &b) {
      b.AppendAttrT<U32>(NFTA_META_DREG, htonl(NFT_REG_1));
      b.AppendAttrT<U32>(NFTA_META_KEY, htonl(NFT_META_NFPROTO));
    });
    U8 nfproto = NFPROTO_IPV4;
    AppendCmpEq(b, StrView((char *)&nfproto, 1));
  }
  // Source address is at offset 12 of the IPv4 header, destination at 16.
  U32 offset = match == AddressMatch::Source ? 12 : 16;
  AppendExpression(b, "payload", [&](BufferBuilder &b) {
    b.AppendAttrT<U32>(NFTA_PAYLOAD_DREG, htonl(NFT_REG_1));
    b.AppendAttrT<U32>(NFTA_PAYLOAD_BASE, htonl(NFT_PAYLOAD_NETWORK_HEADER));
    b.AppendAttrT<U32>(NFTA_PAYLOAD_OFFSET, htonl(offset));
    b.AppendAttrT<U32>(NFTA_PAYLOAD_LEN, htonl(4));
  });
  AppendCmpEq(b, StrView((char *)&ip.addr, sizeof(ip.addr)));
  AppendExpression(b, "counter", [](BufferBuilder &) {});
  return b.buffer;
}

static Str CommentFromUserdata(StrView userdata) {
  while (userdata.size() >= 2) {
    U8 type = userdata[0];
    U8 len = userdata[1];
    if (userdata.size() < 2u + len) {
      break;
    }
    StrView value = userdata.substr(2, len);
    if (type == kUserdataComment) {
      if (auto nul = value.find('\0'); nul != StrView::npos) {
        value = value.substr(0, nul);
      }
      return Str(value);
    }
    userdata.remove_prefix(2 + len);
  }
  return "";
}

static void DecodeCounter(Netlink::Attr &data, Rule &rule) {
  for (auto &attr : data.Unnest()) {
    U64 value;
    if (!attr.Get(value)) {
      continue;
    }
    if (attr.type == NFTA_COUNTER_BYTES) {
      rule.bytes = be64toh(value);
    } else if (attr.type == NFTA_COUNTER_PACKETS) {
      rule.packets = be64toh(value);
    }
  }
}

static void DecodeExpressions(Netlink::Attr &expressions, Rule &rule) {
  bool counter_seen = false;
  for (auto &elem : expressions.Unnest()) {
    if (elem.type != NFTA_LIST_ELEM) {
      continue;
    }
    StrView name;
    Netlink::Attr *data = nullptr;
    for (auto &attr : elem.Unnest()) {
      if (attr.type == NFTA_EXPR_NAME) {
        name = attr.CStr();
      } else if (attr.type == NFTA_EXPR_DATA) {
        data = &attr;
      }
    }
    if (name == "counter" && data && !counter_seen) {
      counter_seen = true;
      DecodeCounter(*data, rule);
    }
  }
}

void GetRules(Netlink &netlink, Family family, const char *table_name,
              const char *chain_name, std::function<void(Rule &)> callback,
              Status &status) {
  BufferBuilder b(256);
  AppendMessage(b, NftType(NFT_MSG_GETRULE), NLM_F_REQUEST | NLM_F_DUMP,
                netlink.seq++, family, [&](BufferBuilder &b) {
                  b.AppendAttrCStr(NFTA_RULE_TABLE, table_name);
                  b.AppendAttrCStr(NFTA_RULE_CHAIN, chain_name);
                });
  netlink.SendRaw(b.buffer, status);
  if (!status.Ok()) {
    status() += "Couldn't request the rule listing";
    return;
  }
  netlink.Receive(
      NftType(NFT_MSG_NEWRULE), sizeof(nfgenmsg),
      [&](void *, Netlink::Attrs attrs) {
        Rule rule;
        bool in_chain = true;
        for (auto &attr : attrs) {
          switch (attr.type) {
          case NFTA_RULE_CHAIN:
            in_chain = attr.CStr() == chain_name;
            break;
          case NFTA_RULE_HANDLE: {
            U64 handle;
            if (attr.Get(handle)) {
              rule.handle = be64toh(handle);
            }
            break;
          }
          case NFTA_RULE_EXPRESSIONS:
            DecodeExpressions(attr, rule);
            break;
          case NFTA_RULE_USERDATA:
            rule.comment = CommentFromUserdata(attr.View());
            break;
          }
        }
        if (in_chain) {
          callback(rule);
        }
      },
      status);
  if (!status.Ok()) {
    status() += f("Couldn't list rules of table \"%s\" chain \"%s\"",
                  table_name, chain_name);
  }
}

} // namespace trafficmon::netfilter
