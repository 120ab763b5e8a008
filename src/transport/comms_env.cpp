// src/transport/comms_env.cpp
#include "comms_env.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <windows.h>
#else
#include <fcntl.h>
#endif

#include "errors.hpp"
#include "transport/fd_stream.hpp"

namespace fleetspeak_client {
namespace transport {

namespace {

std::string require_env(const std::string &var) {
  const char *value = std::getenv(var.c_str());
  if (value == nullptr) {
    throw ChannelEnvError(ChannelEnvError::Reason::NotSpecified, var, "");
  }
  return value;
}

long long parse_integer(const std::string &var, const std::string &value) {
  // Plain decimal digits only, no whitespace or sign.
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
    throw ChannelEnvError(ChannelEnvError::Reason::NotParsable, var, value);
  }

  errno = 0;
  char *end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0' || parsed < 0) {
    throw ChannelEnvError(ChannelEnvError::Reason::NotParsable, var, value);
  }
  return parsed;
}

} // namespace

#ifdef _WIN32

int descriptor_from_env(const std::string &var, bool for_writing) {
  const std::string value = require_env(var);
  const long long raw = parse_integer(var, value);

  HANDLE handle = reinterpret_cast<HANDLE>(static_cast<intptr_t>(raw));

  // Unknown type with a last error means a broken handle; any other type is
  // not what the daemon hands out.
  SetLastError(NO_ERROR);
  const DWORD file_type = GetFileType(handle);
  if (file_type != FILE_TYPE_PIPE) {
    const DWORD code = GetLastError();
    if (code != NO_ERROR) {
      throw ChannelEnvError(ChannelEnvError::Reason::InvalidDescriptor, var,
                            "handle " + value + ": error " +
                                std::to_string(code));
    }
    throw ChannelEnvError(ChannelEnvError::Reason::InvalidDescriptor, var,
                          "handle " + value + " has file type " +
                              std::to_string(file_type));
  }

  const int flags = (for_writing ? _O_WRONLY : _O_RDONLY) | _O_BINARY;
  const int fd = _open_osfhandle(reinterpret_cast<intptr_t>(handle), flags);
  if (fd == -1) {
    throw ChannelEnvError(ChannelEnvError::Reason::InvalidDescriptor, var,
                          "handle " + value + ": _open_osfhandle failed");
  }
  return fd;
}

#else

int descriptor_from_env(const std::string &var, bool /*for_writing*/) {
  const std::string value = require_env(var);
  const long long raw = parse_integer(var, value);
  if (raw > 0x7FFFFFFF) {
    throw ChannelEnvError(ChannelEnvError::Reason::NotParsable, var, value);
  }

  const int fd = static_cast<int>(raw);
  if (::fcntl(fd, F_GETFD) == -1) {
    throw ChannelEnvError(ChannelEnvError::Reason::InvalidDescriptor, var,
                          "file descriptor '" + value +
                              "': " + std::strerror(errno));
  }
  return fd;
}

#endif

ChannelPair comms_from_env(const std::string &input_var,
                           const std::string &output_var) {
  const int in_fd = descriptor_from_env(input_var, false);
  const int out_fd = descriptor_from_env(output_var, true);

  // The daemon owns these descriptors; never close them behind its back.
  ChannelPair pair;
  pair.input = std::make_unique<FdInputStream>(in_fd, false);
  pair.output = std::make_unique<FdOutputStream>(out_fd, false);
  return pair;
}

} // namespace transport
} // namespace fleetspeak_client
