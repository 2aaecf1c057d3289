#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   DEBUG << "detailed message";
//   LOG << "regular message";
//   WARN << "something looks off but we can continue";
//   ERROR << "error message";
//   FATAL << "stop the execution";
//
// Logging can also accept other types - integers, IPs, MACs & Status.
//
// Messages below the level set with `SetLogLevel` are dropped before they reach
// any logger.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.

#include <chrono>
#include <functional>
#include <source_location>
#include <vector>

#include "status.hh"
#include "str.hh"

namespace trafficmon {

enum class LogLevel { Ignore, Debug, Info, Warning, Error, Fatal };

// Parses one of "debug", "info", "warn" or "error". Anything else maps to Info.
LogLevel ParseLogLevel(StrView);

// Lowercase name, as accepted by `ParseLogLevel`.
const char *LogLevelName(LogLevel);

void SetLogLevel(LogLevel);
LogLevel GetLogLevel();

// Short name of the program part that is logging ("traffic-sync",
// "mqtt-traffic"). Printed by the default logger & passed to syslog.
void SetLogTag(StrView);
const Str &GetLogTag();

// Appends the logged message when destroyed.
struct LogEntry {
  LogLevel log_level;
  std::chrono::system_clock::time_point timestamp;
  std::source_location location;
  mutable std::string buffer;
  mutable int errsv; // saved errno (if any)

  LogEntry(LogLevel,
           const std::source_location location = std::source_location::current());
  ~LogEntry();
};

using Logger = std::function<void(const LogEntry &)>;

// Prints "YYYY-mm-dd HH:MM:SS [tag] level: message" to stderr.
void DefaultLogger(const LogEntry &e);

// Forwards messages to syslog (`logread` on OpenWrt). Opens the log on first
// use with the current log tag.
void SyslogLogger(const LogEntry &e);

// The default logger prints to stderr.
extern std::vector<Logger> loggers;

#define DEBUG                                                                  \
  trafficmon::LogEntry(trafficmon::LogLevel::Debug,                            \
                       std::source_location::current())
#define LOG                                                                    \
  trafficmon::LogEntry(trafficmon::LogLevel::Info,                             \
                       std::source_location::current())
#define WARN                                                                   \
  trafficmon::LogEntry(trafficmon::LogLevel::Warning,                          \
                       std::source_location::current())
#define ERROR                                                                  \
  trafficmon::LogEntry(trafficmon::LogLevel::Error,                            \
                       std::source_location::current())
#define FATAL                                                                  \
  trafficmon::LogEntry(trafficmon::LogLevel::Fatal,                            \
                       std::source_location::current())

const LogEntry &operator<<(const LogEntry &, StrView);
const LogEntry &operator<<(const LogEntry &, const char *);
const LogEntry &operator<<(const LogEntry &, const Str &);
const LogEntry &operator<<(const LogEntry &, const Status &status);

const LogEntry &operator<<(const LogEntry &logger, const Stringer auto &t) {
  return logger << StrView(ToStr(t));
}

} // namespace trafficmon
