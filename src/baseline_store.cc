#include "baseline_store.hh"

#include <charconv>
#include <errno.h>

#include "format.hh"

namespace trafficmon {

Str BaselineRecord::Serialize() const {
  Str out;
  out += f("bw_bytes=%llu\n", bw_bytes);
  out += f("bw_ts=%lld\n", (long long)bw_ts);
  out += f("day_bytes=%llu\n", day_bytes);
  out += "day_date=" + day_date + "\n";
  out += f("week_bytes=%llu\n", week_bytes);
  out += "week_num=" + week_num + "\n";
  return out;
}

BaselineRecord BaselineRecord::Parse(StrView contents, Status &status) {
  BaselineRecord record;
  for (StrView line : Split(contents, '\n')) {
    Str trimmed(line);
    StripWhitespace(trimmed);
    if (trimmed.empty()) {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == Str::npos) {
      AppendErrorMessage(status) += "Missing '=' in \"" + trimmed + "\"";
      return {};
    }
    StrView key = StrView(trimmed).substr(0, eq);
    StrView value = StrView(trimmed).substr(eq + 1);
    U64 *number = nullptr;
    if (key == "bw_bytes") {
      number = &record.bw_bytes;
    } else if (key == "day_bytes") {
      number = &record.day_bytes;
    } else if (key == "week_bytes") {
      number = &record.week_bytes;
    } else if (key == "bw_ts") {
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                       record.bw_ts);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        AppendErrorMessage(status) += "Invalid bw_ts \"" + Str(value) + "\"";
        return {};
      }
    } else if (key == "day_date") {
      record.day_date = value;
    } else if (key == "week_num") {
      record.week_num = value;
    }
    if (number && !ParseU64(value, *number)) {
      AppendErrorMessage(status) +=
          "Invalid " + Str(key) + " \"" + Str(value) + "\"";
      return {};
    }
  }
  return record;
}

Path BaselineStore::RecordPath(StrView mac, Direction direction) const {
  Str name(mac);
  for (char &c : name) {
    if (c == ':') {
      c = '_';
    }
  }
  name += '_';
  name += DirectionName(direction);
  return dir / name;
}

std::optional<BaselineRecord> BaselineStore::Load(StrView mac,
                                                  Direction direction,
                                                  Status &status) const {
  Path path = RecordPath(mac, direction);
  Status read_status;
  Str contents = ReadFile(path, read_status);
  if (!read_status.Ok()) {
    if (read_status.errsv == ENOENT) {
      return std::nullopt;
    }
    status = std::move(read_status);
    return std::nullopt;
  }
  auto record = BaselineRecord::Parse(contents, status);
  if (!status.Ok()) {
    status() += "Malformed baseline record " + path.str;
    return std::nullopt;
  }
  return record;
}

void BaselineStore::Save(StrView mac, Direction direction,
                         const BaselineRecord &record, Status &status) const {
  dir.MakeDirs(status);
  RETURN_ON_ERROR(status);
  WriteFileAtomic(RecordPath(mac, direction), record.Serialize(), status);
}

} // namespace trafficmon
