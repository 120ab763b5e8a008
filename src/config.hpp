#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

#include "client.hpp"
#include "connection.hpp"
#include "transport/comms_env.hpp"

namespace fleetspeak_client {

// Identity of the service as reported to Fleetspeak
struct ServiceConfig {
  std::string name;    // Server-side service that receives our messages
  std::string version; // Self-reported version sent in StartupData
};

// Where the daemon-provided channels come from
struct ChannelConfig {
  std::string input_env = transport::kInputEnvVar;
  std::string output_env = transport::kOutputEnvVar;
  uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
};

struct HeartbeatConfig {
  std::chrono::milliseconds rate{1000};
};

// Complete client configuration
struct ClientConfig {
  std::string config_file_path; // Empty when loaded from a string
  ServiceConfig service;
  ChannelConfig channel;
  HeartbeatConfig heartbeat;
};

// Load client configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ClientConfig load_config(const std::string &path);

// Same as load_config, from YAML text
ClientConfig load_config_content(const std::string &yaml_content);

ConnectOptions connect_options(const ClientConfig &config);

} // namespace fleetspeak_client
