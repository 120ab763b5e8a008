#pragma once

#include <cstdint>
#include <string>

#include "envelope.hpp"
#include "fleetspeak_channel/channel.pb.h"
#include "packet.hpp"

namespace system_messages {

// Destination of every message addressed to the daemon itself.
constexpr const char *kSystemService = "system";

inline fleetspeak_client::Envelope make_heartbeat() {
  fleetspeak_client::Envelope e;
  e.message_type = "Heartbeat";
  e.destination_service = kSystemService;
  return e;
}

inline fleetspeak_client::Envelope make_startup(const std::string &version,
                                                int64_t pid) {
  fleetspeak::channel::StartupData data;
  data.set_pid(pid);
  data.set_version(version);

  fleetspeak_client::Envelope e;
  e.message_type = "StartupData";
  e.destination_service = kSystemService;
  e.payload = fleetspeak_client::Payload{
      fleetspeak_client::type_url(data),
      fleetspeak_client::PayloadCodec<fleetspeak::channel::StartupData>::encode(
          data)};
  return e;
}

} // namespace system_messages
