#include "path.hh"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "fd.hh"

namespace trafficmon {

Path Path::Parent() const {
  auto slash_pos = str.rfind(kSeparator);
  if (slash_pos == StrView::npos) {
    return Path();
  } else if (slash_pos == 0) {
    return Path("/");
  } else {
    return Path(str.substr(0, slash_pos));
  }
}

bool Path::Exists() const {
  struct stat st;
  return stat(str.c_str(), &st) == 0;
}

Path Path::operator/(StrView rhs) const {
  Path ret(str);
  if (!ret.str.empty() && !ret.str.ends_with(kSeparator)) {
    ret.str.append(1, kSeparator);
  }
  ret.str.append(rhs);
  return ret;
}

void Path::Unlink(Status &status, bool missing_ok) const {
  int ret = unlink(str.c_str());
  if (ret < 0) {
    if (errno == ENOENT and missing_ok) {
      errno = 0;
      return;
    }
    AppendErrorMessage(status) += "unlink(" + str + ") failed";
  }
}

void Path::Rename(const Path &to, Status &status) const {
  int ret = rename(str.c_str(), to.str.c_str());
  if (ret < 0) {
    AppendErrorMessage(status) += "rename(" + str + ", " + to.str + ") failed";
  }
}

void Path::MakeDirs(Status &status, Mode mode) const {
  if (str.empty()) {
    return;
  }
  struct stat st;
  if (stat(str.c_str(), &st) == 0) {
    if (!S_ISDIR(st.st_mode)) {
      errno = ENOTDIR;
      AppendErrorMessage(status) += str + " exists but is not a directory";
    }
    return;
  }
  Path parent = Parent();
  if (!parent.str.empty() && parent.str != str) {
    parent.MakeDirs(status, mode);
    if (!status.Ok()) {
      return;
    }
  }
  if (mkdir(str.c_str(), mode) < 0 && errno != EEXIST) {
    AppendErrorMessage(status) += "mkdir(" + str + ") failed";
    return;
  }
  errno = 0;
}

Str ToStr(const Path &path) { return path.str; }

Str ReadFile(const Path &path, Status &status) {
  FD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    AppendErrorMessage(status) += "open(" + path.str + ") failed";
    return {};
  }
  Str contents;
  char buf[4096];
  while (true) {
    SSize n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      AppendErrorMessage(status) += "read(" + path.str + ") failed";
      return {};
    }
    if (n == 0) {
      break;
    }
    contents.append(buf, n);
  }
  return contents;
}

void WriteFileAtomic(const Path &path, StrView contents, Status &status,
                     Mode mode) {
  Path tmp = path.str + ".tmp";
  {
    FD fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
      AppendErrorMessage(status) += "open(" + tmp.str + ") failed";
      return;
    }
    while (!contents.empty()) {
      SSize n = write(fd, contents.data(), contents.size());
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        AppendErrorMessage(status) += "write(" + tmp.str + ") failed";
        Status ignore;
        tmp.Unlink(ignore, true);
        return;
      }
      contents.remove_prefix(n);
    }
  }
  tmp.Rename(path, status);
}

} // namespace trafficmon
