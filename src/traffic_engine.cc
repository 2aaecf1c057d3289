#include "traffic_engine.hh"

#include <chrono>
#include <map>
#include <thread>

#include "calendar.hh"
#include "log.hh"

namespace trafficmon {

std::vector<BandwidthSample>
ComputeBandwidth(const std::vector<CounterSample> &first,
                 const std::vector<CounterSample> &second,
                 U64 interval_seconds) {
  std::map<std::pair<IP, Direction>, U64> before;
  for (auto &sample : first) {
    before[{sample.ip, sample.direction}] = sample.bytes;
  }
  std::vector<BandwidthSample> result;
  result.reserve(second.size());
  for (auto &sample : second) {
    U64 start = 0;
    if (auto it = before.find({sample.ip, sample.direction});
        it != before.end()) {
      start = it->second;
    }
    U64 delta = sample.bytes > start ? sample.bytes - start : 0;
    result.push_back(BandwidthSample{
        .ip = sample.ip,
        .direction = sample.direction,
        .bytes = sample.bytes,
        .packets = sample.packets,
        .bandwidth = interval_seconds ? delta / interval_seconds : 0,
    });
  }
  return result;
}

PeriodUsage UpdateBaseline(BaselineRecord &record, U64 bytes_now, time_t now,
                           StrView day_key, StrView week_key) {
  if (bytes_now < record.day_bytes) {
    record.day_bytes = 0;
    record.day_date.clear();
  }
  if (bytes_now < record.week_bytes) {
    record.week_bytes = 0;
    record.week_num.clear();
  }
  if (record.day_date != day_key) {
    record.day_bytes = bytes_now;
    record.day_date = day_key;
  }
  if (record.week_num != week_key) {
    record.week_bytes = bytes_now;
    record.week_num = week_key;
  }
  record.bw_bytes = bytes_now;
  record.bw_ts = now;
  return PeriodUsage{
      .daily = bytes_now - record.day_bytes,
      .weekly = bytes_now - record.week_bytes,
  };
}

std::vector<TrafficReport> TrafficEngine::Run(int &matched, Status &status) {
  std::vector<TrafficReport> reports;
  matched = 0;

  auto first = ReadCounters(filter, status);
  if (!status.Ok()) {
    status() += "Couldn't read the first counter snapshot";
    return reports;
  }
  if (first.empty()) {
    return reports;
  }

  DEBUG << "Waiting " << interval_seconds << "s for the second snapshot";
  sleep(interval_seconds);

  auto second = ReadCounters(filter, status);
  if (!status.Ok()) {
    status() += "Couldn't read the second counter snapshot";
    return reports;
  }
  matched = (int)second.size();

  time_t now = clock();
  Str day_key = DayKey(now);
  Str week_key = WeekKey(now);

  for (auto &sample : ComputeBandwidth(first, second, interval_seconds)) {
    const char *dir = DirectionName(sample.direction);
    if (skip_ip && sample.ip == *skip_ip) {
      DEBUG << "Skipping broker IP " << sample.ip;
      continue;
    }
    auto device = identity.Resolve(sample.ip);
    if (!device) {
      WARN << "No MAC found for IP " << sample.ip << " (dir=" << dir
           << "). Skipping.";
      continue;
    }

    Status load_status;
    auto stored = store.Load(device->mac, sample.direction, load_status);
    if (!load_status.Ok()) {
      WARN << "Starting a new baseline for " << device->mac << " " << dir
           << ": " << load_status;
    }
    BaselineRecord record = stored.value_or(BaselineRecord{});
    PeriodUsage usage =
        UpdateBaseline(record, sample.bytes, now, day_key, week_key);

    Status save_status;
    store.Save(device->mac, sample.direction, record, save_status);
    if (!save_status.Ok()) {
      ERROR << "Couldn't persist baseline for " << device->mac << " " << dir
            << ": " << save_status;
      continue;
    }

    reports.push_back(TrafficReport{
        .ip = sample.ip,
        .mac = device->mac,
        .name = device->name,
        .direction = sample.direction,
        .bytes = sample.bytes,
        .packets = sample.packets,
        .bandwidth = sample.bandwidth,
        .daily = usage.daily,
        .weekly = usage.weekly,
        .timestamp = now,
    });
  }
  return reports;
}

void SleepSeconds(U64 seconds) {
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
}

} // namespace trafficmon
