#include "synchronizer.hh"

#include <set>
#include <unordered_set>

#include "counters.hh"
#include "log.hh"

namespace trafficmon {

void EnsureContainer(PacketFilter &filter, Status &status) {
  bool table_exists = filter.TableExists(status);
  RETURN_ON_ERROR(status);
  if (!table_exists) {
    LOG << "Creating table " << filter.Name();
    filter.CreateTable(status);
    RETURN_ON_ERROR(status);
  }
  bool chain_exists = filter.ChainExists(status);
  RETURN_ON_ERROR(status);
  if (!chain_exists) {
    LOG << "Creating chain " << filter.Name();
    filter.CreateChain(status);
    RETURN_ON_ERROR(status);
  }
}

static void LogManagedRules(PacketFilter &filter) {
  Status status;
  auto owned = ListOwnedRules(filter, status);
  if (!status.Ok()) {
    WARN << "Couldn't list managed rules: " << status;
    return;
  }
  LOG << "Managed rules: " << owned.size();
  for (auto &rule : owned) {
    DEBUG << "  " << EncodeTag(rule.tag.ip, rule.tag.direction) << " (handle "
          << rule.handle << ")";
  }
}

SyncReport SyncRules(PacketFilter &filter, const LeaseTable *leases,
                     Status &status) {
  SyncReport report;

  EnsureContainer(filter, status);
  if (!status.Ok()) {
    status() += "Couldn't prepare " + filter.Name();
    return report;
  }

  if (leases == nullptr) {
    WARN << "Lease table unavailable. Leaving the rules unchanged.";
    return report;
  }

  auto desired = leases->UniqueAddresses();
  LOG << "Leased IPv4 addresses: " << desired.size();
  if (desired.empty()) {
    // Most likely dnsmasq is restarting. Removing every rule now would reset
    // all counters.
    WARN << "No leased IPv4 addresses. Leaving the rules unchanged.";
    return report;
  }

  auto owned = ListOwnedRules(filter, status);
  if (!status.Ok()) {
    status() += "Couldn't list rules of " + filter.Name();
    return report;
  }

  // The first rule of each (address, direction) is kept. Later rules with the
  // same tag would be counted twice.
  std::set<std::pair<IP, Direction>> present;
  std::unordered_set<U64> duplicates;
  for (auto &rule : owned) {
    if (!present.emplace(rule.tag.ip, rule.tag.direction).second) {
      duplicates.insert(rule.handle);
    }
  }

  for (IP ip : desired) {
    for (Direction direction : {Direction::Outbound, Direction::Inbound}) {
      if (present.contains({ip, direction})) {
        DEBUG << "Keeping " << EncodeTag(ip, direction);
        ++report.kept;
        continue;
      }
      Str tag = EncodeTag(ip, direction);
      Status add_status;
      filter.AddCounterRule(ip, direction, tag, add_status);
      if (!add_status.Ok()) {
        ERROR << "Couldn't add rule " << tag << ": " << add_status;
        ++report.failed;
        continue;
      }
      LOG << "Added rule " << tag;
      ++report.added;
    }
  }

  std::unordered_set<IP> desired_set(desired.begin(), desired.end());
  for (auto &rule : owned) {
    bool duplicate = duplicates.contains(rule.handle);
    if (!duplicate && desired_set.contains(rule.tag.ip)) {
      continue;
    }
    Str tag = EncodeTag(rule.tag.ip, rule.tag.direction);
    Status delete_status;
    filter.DeleteRule(rule.handle, delete_status);
    if (!delete_status.Ok()) {
      ERROR << "Couldn't delete rule " << tag << " (handle " << rule.handle
            << "): " << delete_status;
      ++report.failed;
      continue;
    }
    LOG << "Deleted " << (duplicate ? "duplicate" : "stale") << " rule " << tag;
    ++report.deleted;
  }

  LogManagedRules(filter);
  return report;
}

} // namespace trafficmon
