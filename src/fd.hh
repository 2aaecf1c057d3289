#pragma once

#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace trafficmon {

// Wrapper around a file descriptor. Closes it when destroyed.
struct FD {
  int fd;

  FD();
  FD(int fd);
  FD(const FD &) = delete;
  FD(FD &&other);
  ~FD();

  operator int() const { return fd; }

  FD &operator=(const FD &) = delete;
  FD &operator=(FD &&other);

  void Close();

  // Writes the whole buffer, retrying on partial writes & EINTR.
  void SendAll(StrView buffer, Status &);

  // Reads exactly `n` bytes. Fails if the peer closes the connection earlier.
  Str ReceiveExactly(Size n, Status &);
};

} // namespace trafficmon
