#include "discovery.hh"

#include "format.hh"
#include "json.hh"
#include "log.hh"

namespace trafficmon {

namespace {

struct SensorKind {
  const char *key;
  const char *title;
  const char *unit;
  const char *device_class;
  const char *state_class;
};

const SensorKind &Kind(Metric metric) {
  static const SensorKind kinds[] = {
      {"bytes", "Bytes", "B", "data_size", "total_increasing"},
      {"bw", "Bandwidth", "B/s", "data_rate", "measurement"},
      {"daily", "Daily", "B", "data_size", "total_increasing"},
      {"weekly", "Weekly", "B", "data_size", "total_increasing"},
  };
  return kinds[(int)metric];
}

const char *DirectionTitle(Direction direction) {
  return direction == Direction::Inbound ? "In" : "Out";
}

Str Quoted(StrView s) {
  Str out = "\"";
  EscapeJSONString(out, s);
  out += '"';
  return out;
}

} // namespace

const char *MetricKey(Metric metric) { return Kind(metric).key; }

Str MACId(StrView mac) {
  Str id(mac);
  for (char &c : id) {
    if (c == ':') {
      c = '_';
    }
  }
  return id;
}

Str Topics::State(StrView mac, Direction direction) const {
  return base + "/" + Str(mac) + "/" + DirectionName(direction);
}

Str Topics::DiscoveryConfig(StrView mac, Direction direction,
                            Metric metric) const {
  return discovery + "/sensor/lan_" + MACId(mac) + "_" +
         DirectionName(direction) + "_" + MetricKey(metric) + "/config";
}

Str DiscoveryPayload(const Topics &topics, StrView mac, StrView name,
                     Direction direction, Metric metric) {
  const SensorKind &kind = Kind(metric);
  Str device_id = "openwrt_" + MACId(mac);
  Str device_name = "LAN " + Str(name);
  Str sensor_name =
      device_name + " " + DirectionTitle(direction) + " " + kind.title;
  Str unique_id = device_id + "_" + DirectionName(direction) + "_" + kind.key;

  Str json = "{";
  json += "\"name\":" + Quoted(sensor_name);
  json += ",\"state_topic\":" + Quoted(topics.State(mac, direction));
  json += ",\"value_template\":" +
          Quoted(f("{{ value_json.%s }}", kind.key));
  json += ",\"unique_id\":" + Quoted(unique_id);
  json += ",\"device_class\":" + Quoted(kind.device_class);
  json += ",\"unit_of_measurement\":" + Quoted(kind.unit);
  json += ",\"state_class\":" + Quoted(kind.state_class);
  json += ",\"device\":{";
  json += "\"identifiers\":[" + Quoted(device_id) + "]";
  json += ",\"name\":" + Quoted(device_name);
  json += ",\"model\":\"OpenWrt nft counters\"";
  json += ",\"manufacturer\":\"OpenWrt\"";
  json += ",\"connections\":[[\"mac\"," + Quoted(mac) + "]]";
  json += "}}";
  return json;
}

Str StatePayload(const TrafficReport &report) {
  Str json = "{";
  json += "\"ip\":" + Quoted(ToStr(report.ip));
  json += ",\"mac\":" + Quoted(report.mac);
  json += ",\"name\":" + Quoted(report.name);
  json += ",\"dir\":" + Quoted(DirectionName(report.direction));
  json += f(",\"bytes\":%llu", report.bytes);
  json += f(",\"packets\":%llu", report.packets);
  json += f(",\"bw\":%llu", report.bandwidth);
  json += f(",\"daily\":%llu", report.daily);
  json += f(",\"weekly\":%llu", report.weekly);
  json += f(",\"ts\":%lld", (long long)report.timestamp);
  json += "}";
  return json;
}

bool Publisher::Send(StrView topic, StrView payload, bool retained) {
  Status status;
  bus.Publish(topic, payload, retained, status);
  if (!status.Ok()) {
    WARN << "MQTT publish failed topic=" << topic
         << " retain=" << (retained ? "true" : "false") << " error=" << status;
    return false;
  }
  return true;
}

void Publisher::PublishDiscovery(StrView mac, StrView name) {
  for (Direction direction : kDirections) {
    for (Metric metric : kMetrics) {
      Send(topics.DiscoveryConfig(mac, direction, metric),
           DiscoveryPayload(topics, mac, name, direction, metric), true);
    }
  }
  LOG << "Discovery published (retained) for " << mac << " (" << name << ")";
}

bool Publisher::Publish(const TrafficReport &report) {
  if (!seen.contains(report.mac)) {
    PublishDiscovery(report.mac, report.name);
    seen.insert(report.mac);
  }
  Str topic = topics.State(report.mac, report.direction);
  Str payload = StatePayload(report);
  LOG << "Publishing state to " << topic << " payload=" << payload;
  return Send(topic, payload, false);
}

} // namespace trafficmon
