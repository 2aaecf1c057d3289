#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

namespace trafficmon {

using Str = std::string;
using StrView = std::string_view;

using namespace std::literals;

void StripLeadingWhitespace(Str &);
void StripTrailingWhitespace(Str &);
void StripWhitespace(Str &);

// Splits `s` on any run of whitespace. Empty fields are never returned.
std::vector<StrView> SplitWhitespace(StrView s);

// Splits `s` on every occurrence of `separator`. Empty fields are kept.
std::vector<StrView> Split(StrView s, char separator);

Str ToLower(StrView);

// Parses a non-negative decimal integer. Rejects signs, whitespace, empty input
// and values that don't fit in 64 bits.
bool ParseU64(StrView, unsigned long long &out);

// ToStr function should be the default way of converting values to strings.
//
// It relies on ADL for lookup so types in other namespaces can provide their
// own overloads next to their definitions.

inline Str ToStr(int val) { return std::to_string(val); }
inline Str ToStr(long val) { return std::to_string(val); }
inline Str ToStr(long long val) { return std::to_string(val); }
inline Str ToStr(unsigned val) { return std::to_string(val); }
inline Str ToStr(unsigned long val) { return std::to_string(val); }
inline Str ToStr(unsigned long long val) { return std::to_string(val); }
inline Str ToStr(double val) { return std::to_string(val); }

template <typename T>
  requires requires(T t) {
    { t.ToStr() } -> std::same_as<Str>;
  }
Str ToStr(const T &t) {
  return t.ToStr();
}

template <typename T>
concept Stringer = requires(T t) {
  { ToStr(t) } -> std::same_as<Str>;
};

} // namespace trafficmon
