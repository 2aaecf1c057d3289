#include "log.hh"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <syslog.h>

#include "format.hh"

namespace trafficmon {

std::vector<Logger> loggers;

static LogLevel min_log_level = LogLevel::Info;
static Str log_tag = "trafficmon";

LogLevel ParseLogLevel(StrView name) {
  if (name == "debug") {
    return LogLevel::Debug;
  } else if (name == "warn") {
    return LogLevel::Warning;
  } else if (name == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

const char *LogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Ignore:
    return "ignore";
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Fatal:
    return "fatal";
  }
  return "info";
}

void SetLogLevel(LogLevel level) { min_log_level = level; }

LogLevel GetLogLevel() { return min_log_level; }

void SetLogTag(StrView tag) { log_tag = tag; }

const Str &GetLogTag() { return log_tag; }

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level), timestamp(std::chrono::system_clock::now()),
      location(location), buffer(), errsv(errno) {}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Ignore) {
    return;
  }
  if (log_level < min_log_level && log_level != LogLevel::Fatal) {
    return;
  }

  if (log_level == LogLevel::Fatal) {
    buffer += f(". Crashing in %s:%u [%s].", location.file_name(),
                (unsigned)location.line(), location.function_name());
  }

  for (auto &logger : loggers) {
    logger(*this);
  }

  if (log_level == LogLevel::Fatal) {
    fflush(stdout);
    fflush(stderr);
    abort();
  }
}

void DefaultLogger(const LogEntry &e) {
  time_t t = std::chrono::system_clock::to_time_t(e.timestamp);
  tm local;
  localtime_r(&t, &local);
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local);
  fprintf(stderr, "%s [%s] %s: %s\n", timestamp, log_tag.c_str(),
          LogLevelName(e.log_level), e.buffer.c_str());
}

void SyslogLogger(const LogEntry &e) {
  // openlog keeps the pointer so the identifier must outlive the process.
  static Str ident;
  if (ident.empty()) {
    ident = log_tag;
    openlog(ident.c_str(), LOG_PID, LOG_DAEMON);
  }
  int priority = LOG_INFO;
  switch (e.log_level) {
  case LogLevel::Debug:
    priority = LOG_DEBUG;
    break;
  case LogLevel::Warning:
    priority = LOG_WARNING;
    break;
  case LogLevel::Error:
    priority = LOG_ERR;
    break;
  case LogLevel::Fatal:
    priority = LOG_CRIT;
    break;
  default:
    break;
  }
  syslog(priority, "%s: %s", LogLevelName(e.log_level), e.buffer.c_str());
}

void __attribute__((__constructor__)) InitDefaultLoggers() {
  loggers.emplace_back(DefaultLogger);
}

const LogEntry &operator<<(const LogEntry &logger, StrView s) {
  logger.buffer += s;
  return logger;
}

const LogEntry &operator<<(const LogEntry &logger, const char *s) {
  logger.buffer += s;
  return logger;
}

const LogEntry &operator<<(const LogEntry &logger, const Str &s) {
  logger.buffer += s;
  return logger;
}

const LogEntry &operator<<(const LogEntry &logger, const Status &status) {
  logger.buffer += status.ToStr();
  logger.errsv = status.errsv;
  return logger;
}

} // namespace trafficmon
