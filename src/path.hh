#pragma once

// Class for working with paths. Based on python's pathlib.

#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace trafficmon {

using Mode = U32;

// Mode for files modifiable by owner but readable by anyone
constexpr Mode RW_R__R__{0644};
constexpr Mode RWXR_XR_X{0755};

struct Path {
  constexpr static char kSeparator = '/';

  Str str;

  Path(const char *str) : str(str) {}
  Path(Str str) : str(std::move(str)) {}
  Path(StrView path) : str(path) {}
  Path() = default;
  Path(const Path &other) = default;
  Path &operator=(const Path &other) = default;

  Path Parent() const;

  bool Exists() const;

  void Unlink(Status &, bool missing_ok = false) const;

  void Rename(const Path &to, Status &) const;

  // Creates this directory & all missing parents. Existing directories are
  // fine.
  void MakeDirs(Status &, Mode = RWXR_XR_X) const;

  Path operator/(StrView rhs) const;

  operator StrView() const { return str; }
  const char *c_str() const { return str.c_str(); }
};

Str ToStr(const Path &);

// Read the whole file.
Str ReadFile(const Path &, Status &);

// Replace the file contents atomically: the data is written to a temporary file
// in the same directory which is then renamed over `path`. Readers see either
// the old or the new contents, never a mix.
void WriteFileAtomic(const Path &, StrView contents, Status &,
                     Mode = RW_R__R__);

} // namespace trafficmon
