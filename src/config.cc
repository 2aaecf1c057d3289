#include "config.hh"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "format.hh"

namespace trafficmon {

static constexpr const char *kKeys[] = {
    "BROKER",     "BROKER_PORT",      "MQTT_USER",    "MQTT_PASS",
    "BASE_TOPIC", "DISCOVERY_PREFIX", "TABLE_FAMILY", "TABLE_NAME",
    "CHAIN_NAME", "LEASES_FILE",      "BW_INTERVAL",  "STATE_DIR",
    "LOG_LEVEL",
};

static void ParseNumber(StrView key, StrView value, U64 min, U64 max,
                        U64 &out, Status &status) {
  unsigned long long number;
  if (!ParseU64(value, number) || number < min || number > max) {
    AppendErrorMessage(status) +=
        f("%.*s must be a number between %llu and %llu, got \"%.*s\"",
          (int)key.size(), key.data(), min, max, (int)value.size(),
          value.data());
    return;
  }
  out = number;
}

static void RequireNonEmpty(StrView key, StrView value, Status &status) {
  if (value.empty()) {
    AppendErrorMessage(status) += Str(key) + " can't be empty";
  }
}

void Config::Set(StrView key, StrView value, Status &status) {
  if (key == "BROKER") {
    RequireNonEmpty(key, value, status);
    broker = value;
  } else if (key == "BROKER_PORT") {
    U64 port = broker_port;
    ParseNumber(key, value, 1, 65535, port, status);
    broker_port = port;
  } else if (key == "MQTT_USER") {
    mqtt_user = value;
  } else if (key == "MQTT_PASS") {
    mqtt_pass = value;
  } else if (key == "BASE_TOPIC") {
    RequireNonEmpty(key, value, status);
    base_topic = value;
  } else if (key == "DISCOVERY_PREFIX") {
    RequireNonEmpty(key, value, status);
    discovery_prefix = value;
  } else if (key == "TABLE_FAMILY") {
    if (auto family = netfilter::ParseFamily(value)) {
      table_family = *family;
    } else {
      AppendErrorMessage(status) +=
          "TABLE_FAMILY must be \"inet\" or \"ip\", got \"" + Str(value) + "\"";
    }
  } else if (key == "TABLE_NAME") {
    RequireNonEmpty(key, value, status);
    table_name = value;
  } else if (key == "CHAIN_NAME") {
    RequireNonEmpty(key, value, status);
    chain_name = value;
  } else if (key == "LEASES_FILE") {
    RequireNonEmpty(key, value, status);
    leases_file = value;
  } else if (key == "BW_INTERVAL") {
    ParseNumber(key, value, 1, 3600, bw_interval, status);
  } else if (key == "STATE_DIR") {
    RequireNonEmpty(key, value, status);
    state_dir = value;
  } else if (key == "LOG_LEVEL") {
    log_level = ParseLogLevel(value);
  } else {
    AppendErrorMessage(status) += "Unknown key " + Str(key);
  }
}

Str Config::ToStr() const {
  return f("broker=%s:%u user=%s base_topic=%s discovery=%s table=%s/%s "
           "chain=%s tag=%s leases=%s interval=%llus state=%s level=%s",
           broker.c_str(), (unsigned)broker_port, mqtt_user.c_str(),
           base_topic.c_str(), discovery_prefix.c_str(),
           netfilter::FamilyName(table_family), table_name.c_str(),
           chain_name.c_str(), "tm", leases_file.c_str(), bw_interval,
           state_dir.c_str(), LogLevelName(log_level));
}

// Comments start with '#' at the beginning of the line or after whitespace,
// outside of quotes.
static void StripComment(Str &line) {
  char quote = 0;
  for (Size i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#' && (i == 0 || isspace((unsigned char)line[i - 1]))) {
      line.resize(i);
      return;
    }
  }
}

static StrView Unquote(StrView value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void ApplyConfigFile(Config &config, StrView contents, Status &status) {
  int line_number = 0;
  for (StrView raw : Split(contents, '\n')) {
    ++line_number;
    Str line(raw);
    StripComment(line);
    StripWhitespace(line);
    if (line.empty()) {
      continue;
    }
    auto eq = line.find('=');
    if (eq == Str::npos) {
      AppendErrorMessage(status) += f("Line %d: expected KEY=value", line_number);
      return;
    }
    Str key = line.substr(0, eq);
    Str value = line.substr(eq + 1);
    StripWhitespace(key);
    StripWhitespace(value);
    config.Set(key, Unquote(value), status);
    if (!status.Ok()) {
      status() += f("Line %d", line_number);
      return;
    }
  }
}

void ApplyEnvironment(Config &config, const GetEnv &get_env, Status &status) {
  for (const char *key : kKeys) {
    const char *value = get_env(key);
    if (value == nullptr) {
      continue;
    }
    config.Set(key, value, status);
    if (!status.Ok()) {
      status() += Str("Environment variable ") + key;
      return;
    }
  }
}

Config LoadConfig(Status &status) {
  Config config;

  Path path = kDefaultConfigPath;
  bool explicit_path = false;
  if (const char *env_path = ::getenv("TRAFFICMON_CONFIG")) {
    path = env_path;
    explicit_path = true;
  }
  Status read_status;
  Str contents = ReadFile(path, read_status);
  if (read_status.Ok()) {
    ApplyConfigFile(config, contents, status);
    if (!status.Ok()) {
      status() += "Invalid config file " + path.str;
      return config;
    }
  } else if (explicit_path || read_status.errsv != ENOENT) {
    status = std::move(read_status);
    status() += "Couldn't read config file " + path.str;
    return config;
  }

  ApplyEnvironment(
      config, [](const char *name) { return ::getenv(name); }, status);
  return config;
}

} // namespace trafficmon
