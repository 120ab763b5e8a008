// src/transport/fd_stream.hpp
#pragma once

#include <istream>
#include <ostream>
#include <ios>
#include <streambuf>
#include <string>
#include <vector>

namespace fleetspeak_client {
namespace transport {

// std::streambuf over a raw file descriptor (a CRT descriptor on Windows).
//
// Input is buffered by read-ahead; output accumulates until sync() or a full
// buffer. Interrupted system calls are retried. The descriptor is closed on
// destruction when owned.
class FdStreamBuf : public std::streambuf {
public:
  FdStreamBuf(int fd, bool owned);
  ~FdStreamBuf() override;

  FdStreamBuf(const FdStreamBuf &) = delete;
  FdStreamBuf &operator=(const FdStreamBuf &) = delete;

  // errno of the last failed read or write, 0 if none failed.
  int last_errno() const { return last_errno_; }

protected:
  int_type underflow() override;
  int_type overflow(int_type ch) override;
  int sync() override;

private:
  bool flush_output();

  int fd_;
  bool owned_;
  int last_errno_ = 0;
  std::vector<char> in_buf_;
  std::vector<char> out_buf_;
};

class FdInputStream : public std::istream {
public:
  explicit FdInputStream(int fd, bool owned = true);

private:
  FdStreamBuf buf_;
};

class FdOutputStream : public std::ostream {
public:
  // Ignores SIGPIPE process-wide on POSIX, so a write to a pipe whose reader
  // is gone fails with EPIPE instead of killing the process.
  explicit FdOutputStream(int fd, bool owned = true);

private:
  FdStreamBuf buf_;
};

// ": <strerror text>" for the last failed system call of an fd-backed
// stream; empty for any other stream or when no call failed.
std::string describe_errno(const std::ios &stream);

} // namespace transport
} // namespace fleetspeak_client
