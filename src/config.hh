#pragma once

#include <functional>

#include "int.hh"
#include "log.hh"
#include "netfilter.hh"
#include "path.hh"
#include "status.hh"
#include "str.hh"

namespace trafficmon {

// Runtime configuration. Built once at startup and passed down explicitly.
//
// Values come from (later ones win):
//
// 1. built-in defaults below,
// 2. the config file ($TRAFFICMON_CONFIG or /etc/trafficmon.conf), with
//    "KEY=value" lines,
// 3. environment variables with the same names.
//
// Keys: BROKER, BROKER_PORT, MQTT_USER, MQTT_PASS, BASE_TOPIC,
// DISCOVERY_PREFIX, TABLE_FAMILY, TABLE_NAME, CHAIN_NAME, LEASES_FILE,
// BW_INTERVAL, STATE_DIR, LOG_LEVEL.
struct Config {
  Str broker = "192.168.46.222";
  U16 broker_port = 1883;
  Str mqtt_user = "mqtt_user";
  Str mqtt_pass = "mqtt";

  Str base_topic = "network/usage";
  Str discovery_prefix = "homeassistant";

  netfilter::Family table_family = netfilter::Family::INET;
  Str table_name = "traffic_monitor";
  Str chain_name = "forward";

  Path leases_file = "/tmp/dhcp.leases";
  U64 bw_interval = 5; // seconds between the counter snapshots
  Path state_dir = "/tmp/trafficmon";

  LogLevel log_level = LogLevel::Info;

  // Sets a single key. Unknown keys & invalid values are reported as errors.
  void Set(StrView key, StrView value, Status &);

  // One-line summary for the startup message. The password is left out.
  Str ToStr() const;
};

constexpr char kDefaultConfigPath[] = "/etc/trafficmon.conf";

// Applies "KEY=value" lines. Blank lines & comments ('#' at the start of a
// line or after whitespace) are ignored.
// Values may be wrapped in double or single quotes.
void ApplyConfigFile(Config &, StrView contents, Status &);

using GetEnv = std::function<const char *(const char *name)>;

// Applies every key that is set in the environment.
void ApplyEnvironment(Config &, const GetEnv &, Status &);

// Defaults, then the config file (if it exists), then the process
// environment.
Config LoadConfig(Status &);

} // namespace trafficmon
