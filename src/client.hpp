#pragma once

#include <memory>
#include <string>

#include "connection.hpp"
#include "transport/comms_env.hpp"

namespace fleetspeak_client {

struct ConnectOptions {
  std::string input_env = transport::kInputEnvVar;
  std::string output_env = transport::kOutputEnvVar;
  ConnectionOptions connection;
};

// Opens the channels the daemon passed through the environment and performs
// the handshake. Call once at startup and keep the result for the lifetime
// of the process.
//
// Throws ChannelEnvError if the environment is incomplete, IoError or
// FramingError if the handshake fails.
std::unique_ptr<Connection> connect(const ConnectOptions &options = ConnectOptions());

} // namespace fleetspeak_client
