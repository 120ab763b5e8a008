// src/transport/fd_stream.cpp
#include "fd_stream.hpp"

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fleetspeak_client {
namespace transport {

namespace {

constexpr std::size_t kInputBufferBytes = 64 * 1024;
constexpr std::size_t kOutputBufferBytes = 64 * 1024;

long sys_read(int fd, char *buf, std::size_t n) {
#ifdef _WIN32
  return _read(fd, buf, static_cast<unsigned int>(n));
#else
  return static_cast<long>(::read(fd, buf, n));
#endif
}

long sys_write(int fd, const char *buf, std::size_t n) {
#ifdef _WIN32
  return _write(fd, buf, static_cast<unsigned int>(n));
#else
  return static_cast<long>(::write(fd, buf, n));
#endif
}

void ignore_sigpipe() {
#ifndef _WIN32
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
#endif
}

void sys_close(int fd) {
#ifdef _WIN32
  _close(fd);
#else
  ::close(fd);
#endif
}

} // namespace

FdStreamBuf::FdStreamBuf(int fd, bool owned)
    : fd_(fd), owned_(owned), in_buf_(kInputBufferBytes),
      out_buf_(kOutputBufferBytes) {
  setg(in_buf_.data(), in_buf_.data(), in_buf_.data());
  setp(out_buf_.data(), out_buf_.data() + out_buf_.size());
}

FdStreamBuf::~FdStreamBuf() {
  flush_output();
  if (owned_ && fd_ >= 0) {
    sys_close(fd_);
  }
}

FdStreamBuf::int_type FdStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  long n;
  do {
    n = sys_read(fd_, in_buf_.data(), in_buf_.size());
  } while (n < 0 && errno == EINTR);

  if (n <= 0) {
    last_errno_ = n < 0 ? errno : 0;
    return traits_type::eof();
  }

  setg(in_buf_.data(), in_buf_.data(), in_buf_.data() + n);
  return traits_type::to_int_type(*gptr());
}

FdStreamBuf::int_type FdStreamBuf::overflow(int_type ch) {
  if (!flush_output()) {
    return traits_type::eof();
  }
  if (!traits_type::eq_int_type(ch, traits_type::eof())) {
    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
  }
  return traits_type::not_eof(ch);
}

int FdStreamBuf::sync() { return flush_output() ? 0 : -1; }

bool FdStreamBuf::flush_output() {
  const char *data = pbase();
  std::size_t remaining = static_cast<std::size_t>(pptr() - pbase());

  while (remaining > 0) {
    const long n = sys_write(fd_, data, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_errno_ = errno;
      return false;
    }
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }

  setp(out_buf_.data(), out_buf_.data() + out_buf_.size());
  return true;
}

FdInputStream::FdInputStream(int fd, bool owned)
    : std::istream(nullptr), buf_(fd, owned) {
  rdbuf(&buf_);
}

FdOutputStream::FdOutputStream(int fd, bool owned)
    : std::ostream(nullptr), buf_(fd, owned) {
  ignore_sigpipe();
  rdbuf(&buf_);
}

std::string describe_errno(const std::ios &stream) {
  const auto *buf = dynamic_cast<const FdStreamBuf *>(stream.rdbuf());
  if (buf == nullptr || buf->last_errno() == 0) {
    return std::string();
  }
  return std::string(": ") + std::strerror(buf->last_errno());
}

} // namespace transport
} // namespace fleetspeak_client
