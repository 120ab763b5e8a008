#include "config.hpp"
#include <filesystem>
#include <stdexcept>

namespace fleetspeak_client {

namespace fs = std::filesystem;

// Reads a required non-empty string field of a map node
static std::string require_string(const YAML::Node &parent,
                                  const std::string &section,
                                  const std::string &key) {
  if (!parent[key]) {
    throw std::runtime_error("[CONFIG] Missing required '" + section + "." +
                             key + "'");
  }

  std::string value;
  try {
    value = parent[key].as<std::string>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid " + section + "." + key + ": " +
                             e.what());
  }

  if (value.empty()) {
    throw std::runtime_error("[CONFIG] " + section + "." + key +
                             " must not be empty");
  }
  return value;
}

static void parse_service(const YAML::Node &yaml, ClientConfig &config) {
  if (!yaml["service"]) {
    throw std::runtime_error("[CONFIG] Missing required 'service' section");
  }
  if (!yaml["service"].IsMap()) {
    throw std::runtime_error("[CONFIG] 'service' section must be a map");
  }

  config.service.name = require_string(yaml["service"], "service", "name");
  config.service.version =
      require_string(yaml["service"], "service", "version");
}

static void parse_channel(const YAML::Node &yaml, ClientConfig &config) {
  const YAML::Node channel = yaml["channel"];
  if (!channel) {
    return;
  }
  if (!channel.IsMap()) {
    throw std::runtime_error("[CONFIG] 'channel' section must be a map");
  }

  if (channel["input_env"]) {
    config.channel.input_env = require_string(channel, "channel", "input_env");
  }
  if (channel["output_env"]) {
    config.channel.output_env =
        require_string(channel, "channel", "output_env");
  }
  if (config.channel.input_env == config.channel.output_env) {
    throw std::runtime_error(
        "[CONFIG] channel.input_env and channel.output_env must differ");
  }

  if (channel["max_frame_bytes"]) {
    long long max_frame_bytes = 0;
    try {
      max_frame_bytes = channel["max_frame_bytes"].as<long long>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error(
          "[CONFIG] channel.max_frame_bytes must be an integer");
    }

    // Validate bounds
    if (max_frame_bytes < 1 || max_frame_bytes > 0xFFFFFFFFLL) {
      throw std::runtime_error(
          "[CONFIG] channel.max_frame_bytes must be in range [1, 4294967295]");
    }
    config.channel.max_frame_bytes = static_cast<uint32_t>(max_frame_bytes);
  }
}

static void parse_heartbeat(const YAML::Node &yaml, ClientConfig &config) {
  const YAML::Node heartbeat = yaml["heartbeat"];
  if (!heartbeat) {
    return;
  }
  if (!heartbeat.IsMap()) {
    throw std::runtime_error("[CONFIG] 'heartbeat' section must be a map");
  }

  if (heartbeat["rate_ms"]) {
    long long rate_ms = 0;
    try {
      rate_ms = heartbeat["rate_ms"].as<long long>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error("[CONFIG] heartbeat.rate_ms must be an integer");
    }

    if (rate_ms < 1 || rate_ms > 3600000) {
      throw std::runtime_error(
          "[CONFIG] heartbeat.rate_ms must be in range [1, 3600000]");
    }
    config.heartbeat.rate = std::chrono::milliseconds(rate_ms);
  }
}

static ClientConfig parse_config(const YAML::Node &yaml) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] Top level must be a map");
  }

  ClientConfig config;
  parse_service(yaml, config);
  parse_channel(yaml, config);
  parse_heartbeat(yaml, config);
  return config;
}

ClientConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  ClientConfig config = parse_config(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

ClientConfig load_config_content(const std::string &yaml_content) {
  YAML::Node yaml;

  try {
    yaml = YAML::Load(yaml_content);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("Failed to parse config: ") +
                             e.what());
  }

  return parse_config(yaml);
}

ConnectOptions connect_options(const ClientConfig &config) {
  ConnectOptions options;
  options.input_env = config.channel.input_env;
  options.output_env = config.channel.output_env;
  options.connection.max_frame_bytes = config.channel.max_frame_bytes;
  return options;
}

} // namespace fleetspeak_client
