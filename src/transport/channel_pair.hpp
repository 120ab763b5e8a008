// src/transport/channel_pair.hpp
#pragma once

#include <istream>
#include <memory>
#include <ostream>

namespace fleetspeak_client {
namespace transport {

// The two one-directional streams connecting a service to the daemon.
// Moved into a Connection, which then owns them exclusively.
struct ChannelPair {
  std::unique_ptr<std::istream> input;
  std::unique_ptr<std::ostream> output;
};

} // namespace transport
} // namespace fleetspeak_client
