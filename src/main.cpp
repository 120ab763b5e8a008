#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "heartbeat.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "fleetspeak-hello: " << msg << "\n";
}

int main(int argc, char **argv) {
  // Parse command-line arguments
  std::optional<std::string> config_path;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    }
  }

  // Require configuration file
  if (!config_path) {
    log_err("FATAL: --config argument is required");
    log_err("Usage: fleetspeak-hello --config <path/to/config.yaml>");
    return 1;
  }

  // Load configuration
  fleetspeak_client::ClientConfig config;
  try {
    log_err("loading configuration from: " + *config_path);
    config = fleetspeak_client::load_config(*config_path);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return 1;
  }

  // Without a connection Fleetspeak shuts the service down anyway
  std::unique_ptr<fleetspeak_client::Connection> connection;
  try {
    connection =
        fleetspeak_client::connect(fleetspeak_client::connect_options(config));
  } catch (const fleetspeak_client::Error &e) {
    log_err("FATAL: Failed to connect: " + std::string(e.what()));
    return 2;
  }

  log_err("connected (service=" + config.service.name +
          ", version=" + config.service.version + ")");

  try {
    connection->announce_startup(config.service.version);

    while (true) {
      const auto request = fleetspeak_client::collect<std::string>(
          *connection, config.heartbeat.rate);

      fleetspeak_client::Packet<std::string> response;
      response.service = config.service.name;
      response.kind = std::string("greeting");
      response.data = "Hello " + request.data + "!";
      connection->send(response);
    }
  } catch (const fleetspeak_client::Error &e) {
    log_err("FATAL: connection failure: " + std::string(e.what()));
    return 3;
  }
}
