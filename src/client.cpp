#include "client.hpp"

#include <iostream>
#include <utility>

namespace fleetspeak_client {

std::unique_ptr<Connection> connect(const ConnectOptions &options) {
  std::cerr << "[Client] opening channels from " << options.input_env << "/"
            << options.output_env << std::endl;

  transport::ChannelPair channels =
      transport::comms_from_env(options.input_env, options.output_env);

  return std::make_unique<Connection>(std::move(channels), options.connection);
}

} // namespace fleetspeak_client
