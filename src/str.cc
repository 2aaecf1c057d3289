#include "str.hh"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "int.hh"

namespace trafficmon {

void StripLeadingWhitespace(Str &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                  [](int ch) { return !std::isspace(ch); }));
}

void StripTrailingWhitespace(Str &s) {
  while (!s.empty() and std::isspace((unsigned char)s.back())) {
    s.pop_back();
  }
}

void StripWhitespace(Str &s) {
  StripLeadingWhitespace(s);
  StripTrailingWhitespace(s);
}

std::vector<StrView> SplitWhitespace(StrView s) {
  std::vector<StrView> result;
  Size i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace((unsigned char)s[i])) {
      ++i;
    }
    Size begin = i;
    while (i < s.size() && !std::isspace((unsigned char)s[i])) {
      ++i;
    }
    if (i > begin) {
      result.push_back(s.substr(begin, i - begin));
    }
  }
  return result;
}

std::vector<StrView> Split(StrView s, char separator) {
  std::vector<StrView> result;
  Size begin = 0;
  while (true) {
    Size end = s.find(separator, begin);
    if (end == StrView::npos) {
      result.push_back(s.substr(begin));
      break;
    }
    result.push_back(s.substr(begin, end - begin));
    begin = end + 1;
  }
  return result;
}

Str ToLower(StrView s) {
  Str ret(s);
  for (char &c : ret) {
    c = std::tolower((unsigned char)c);
  }
  return ret;
}

bool ParseU64(StrView s, unsigned long long &out) {
  if (s.empty()) {
    return false;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return false;
  }
  out = value;
  return true;
}

} // namespace trafficmon
