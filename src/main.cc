#include <cstdlib>
#include <ctime>
#include <unistd.h>

#include "baseline_store.hh"
#include "config.hh"
#include "counters.hh"
#include "discovery.hh"
#include "format.hh"
#include "identity.hh"
#include "leases.hh"
#include "log.hh"
#include "mqtt.hh"
#include "packet_filter.hh"
#include "status.hh"
#include "synchronizer.hh"
#include "traffic_engine.hh"

using namespace trafficmon;

static void Usage(const char *argv0) {
  ERROR << "Usage: " << argv0 << " sync|publish\n"
        << "\n"
        << "  sync     create & remove counter rules to match the DHCP leases\n"
        << "  publish  publish per-device traffic to MQTT (Home Assistant)\n"
        << "\n"
        << "Configuration is read from " << kDefaultConfigPath
        << " (or $TRAFFICMON_CONFIG) and the environment.";
}

// Shared startup of both commands. Returns false when the command can't run.
static bool Setup(const char *log_tag, Config &config) {
  SetLogTag(log_tag);
  Status status;
  config = LoadConfig(status);
  if (!status.Ok()) {
    ERROR << status;
    return false;
  }
  SetLogLevel(config.log_level);
  loggers.emplace_back(SyslogLogger);
  LOG << "Starting. " << config;
  return true;
}

static int Sync() {
  Config config;
  if (!Setup("traffic-sync", config)) {
    return 1;
  }
  Status status;
  NftablesFilter filter(config.table_family, config.table_name,
                        config.chain_name, status);
  if (!status.Ok()) {
    ERROR << status;
    return 1;
  }

  Status lease_status;
  LeaseTable leases = ReadLeaseFile(config.leases_file, lease_status);
  if (!lease_status.Ok()) {
    WARN << "Leases file not readable: " << lease_status;
  }

  SyncReport report =
      SyncRules(filter, lease_status.Ok() ? &leases : nullptr, status);
  if (!status.Ok()) {
    ERROR << status;
    return 1;
  }
  LOG << "Sync finished. added=" << report.added
      << " deleted=" << report.deleted << " kept=" << report.kept
      << " failed=" << report.failed;
  return 0;
}

static int Publish() {
  Config config;
  if (!Setup("mqtt-traffic", config)) {
    return 1;
  }
  Status status;
  NftablesFilter filter(config.table_family, config.table_name,
                        config.chain_name, status);
  if (!status.Ok()) {
    ERROR << status;
    return 1;
  }

  bool table_exists = filter.TableExists(status);
  if (!status.Ok() || !table_exists) {
    ERROR << "Missing nft table: " << netfilter::FamilyName(config.table_family)
          << " " << config.table_name << " " << status;
    return 1;
  }
  bool chain_exists = filter.ChainExists(status);
  if (!status.Ok() || !chain_exists) {
    ERROR << "Missing nft chain: " << filter.Name() << " " << status;
    return 1;
  }

  auto counters = ReadCounters(filter, status);
  if (!status.Ok()) {
    ERROR << status;
    return 1;
  }
  if (counters.empty()) {
    WARN << "No counters matched. Check: nft -a list chain " << filter.Name();
    return 0;
  }

  Status lease_status;
  LeaseTable leases = ReadLeaseFile(config.leases_file, lease_status);
  if (!lease_status.Ok()) {
    WARN << "Leases file not readable, using the neighbor table only: "
         << lease_status;
  }
  IdentityResolver identity{.leases = leases,
                            .neighbors = KernelNeighborLookup()};
  BaselineStore store(config.state_dir);

  std::optional<IP> broker_ip;
  if (IP ip; ip.TryParse(config.broker)) {
    broker_ip = ip;
  }

  mqtt::Client client;
  client.Connect(
      mqtt::Options{
          .host = config.broker,
          .port = config.broker_port,
          .username = config.mqtt_user,
          .password = config.mqtt_pass,
          .client_id = f("trafficmon-%d", (int)getpid()),
          // Nothing is sent while the engine waits for the second snapshot.
          .keep_alive_seconds = mqtt::KeepAliveFor(config.bw_interval),
      },
      status);
  if (!status.Ok()) {
    ERROR << "Couldn't connect to the MQTT broker: " << status;
    return 1;
  }

  TrafficEngine engine{
      .filter = filter,
      .identity = identity,
      .store = store,
      .interval_seconds = config.bw_interval,
      .skip_ip = broker_ip,
      .sleep = SleepSeconds,
      .clock = [] { return time(nullptr); },
  };
  int matched = 0;
  auto reports = engine.Run(matched, status);
  if (!status.Ok()) {
    ERROR << status;
    return 1;
  }

  Publisher publisher{.bus = client,
                      .topics = {.base = config.base_topic,
                                 .discovery = config.discovery_prefix}};
  for (auto &report : reports) {
    publisher.Publish(report);
  }

  client.Disconnect(status);
  if (!status.Ok()) {
    WARN << "MQTT disconnect failed: " << status;
  }
  LOG << "Done. matched_rows=" << matched;
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc != 2) {
    Usage(argv[0]);
    return 1;
  }
  StrView command = argv[1];
  if (command == "sync") {
    return Sync();
  } else if (command == "publish") {
    return Publish();
  }
  Usage(argv[0]);
  return 1;
}
