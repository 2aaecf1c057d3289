#include "fd.hh"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

#include "int.hh"

namespace trafficmon {

FD::FD() : fd(-1) {}
FD::FD(int fd) : fd(fd) {}
FD::FD(FD &&other) : fd(other.fd) { other.fd = -1; }
FD::~FD() { Close(); }

FD &FD::operator=(FD &&other) {
  Close();
  fd = other.fd;
  other.fd = -1;
  return *this;
}

void FD::SendAll(StrView buffer, Status &status) {
  while (!buffer.empty()) {
    SSize n = send(fd, buffer.data(), buffer.size(), MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      AppendErrorMessage(status) += "send()";
      return;
    }
    buffer.remove_prefix(n);
  }
}

Str FD::ReceiveExactly(Size n, Status &status) {
  Str buffer(n, '\0');
  Size received = 0;
  while (received < n) {
    SSize r = recv(fd, buffer.data() + received, n - received, 0);
    if (r < 0) {
      if (errno == EINTR) {
        continue;
      }
      AppendErrorMessage(status) += "recv()";
      return {};
    }
    if (r == 0) {
      AppendErrorMessage(status) += "Connection closed by peer";
      return {};
    }
    received += r;
  }
  return buffer;
}

void FD::Close() {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

} // namespace trafficmon
