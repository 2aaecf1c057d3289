#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace trafficmon {

// Chain of error messages, each tagged with the place where it was added.
//
// Functions that can fail take a `Status &` as their last argument. On failure
// they append a message with `status() += "..."`. Callers check `status.Ok()`
// and may append their own context before passing the error further up.
//
// The first message also captures the current `errno`.
struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Str message;
  };

  std::unique_ptr<Entry> entry;

  int errsv; // Saved errno value

  Status();
  Status(Status &&) = default;
  Status &operator=(Status &&) = default;

  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  bool Ok() const;
  Str ToStr() const;
  void Reset();
};

inline bool OK(const Status &status) { return status.Ok(); }
inline Str ErrorMessage(const Status &s) { return s.ToStr(); }
inline Str &AppendErrorMessage(
    Status &status,
    const std::source_location location_arg = std::source_location::current()) {
  return status(location_arg);
}

#define RETURN_ON_ERROR(status)                                                \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return;                                                                    \
  }

#define RETURN_VAL_ON_ERROR(status, value)                                     \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return value;                                                              \
  }

} // namespace trafficmon
