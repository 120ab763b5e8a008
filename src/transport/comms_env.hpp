// src/transport/comms_env.hpp
#pragma once

#include <string>

#include "transport/channel_pair.hpp"

namespace fleetspeak_client {
namespace transport {

// Variables set by the Fleetspeak client daemon when it spawns a service.
constexpr const char *kInputEnvVar = "FLEETSPEAK_COMMS_CHANNEL_INFD";
constexpr const char *kOutputEnvVar = "FLEETSPEAK_COMMS_CHANNEL_OUTFD";

// Returns an open descriptor named by environment variable `var`.
//
// On POSIX the value is a decimal file descriptor. On Windows it is a pipe
// HANDLE, converted to a CRT descriptor opened for `for_writing`.
// Throws ChannelEnvError if the variable is missing, unparsable, or does not
// name an open descriptor.
int descriptor_from_env(const std::string &var, bool for_writing);

// Wraps the descriptors given by the daemon into streams. The descriptors
// stay open for the lifetime of the process.
ChannelPair comms_from_env(const std::string &input_var = kInputEnvVar,
                           const std::string &output_var = kOutputEnvVar);

} // namespace transport
} // namespace fleetspeak_client
