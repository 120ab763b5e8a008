#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "fleetspeak/common.pb.h"
#include "transport/framing.hpp"

namespace fleetspeak_client {

// Contents of google.protobuf.Any carried in Message.data.
struct Payload {
  std::string type_url;
  std::string value; // Serialized bytes

  bool operator==(const Payload &other) const {
    return type_url == other.type_url && value == other.value;
  }
  bool operator!=(const Payload &other) const { return !(*this == other); }
};

// The fields of fleetspeak.Message this connector reads or writes.
struct Envelope {
  std::string message_type;
  std::string destination_service;
  std::optional<std::string> source_service;
  std::optional<Payload> payload;

  bool operator==(const Envelope &other) const {
    return message_type == other.message_type &&
           destination_service == other.destination_service &&
           source_service == other.source_service && payload == other.payload;
  }
  bool operator!=(const Envelope &other) const { return !(*this == other); }
};

fleetspeak::Message to_proto(const Envelope &envelope);
Envelope from_proto(const fleetspeak::Message &message);

// Serializes the envelope into a complete frame.
// Throws EncodeError if destination_service is empty, the message does not
// serialize, or it is longer than max_len.
std::vector<uint8_t>
encode_frame(const Envelope &envelope,
             uint32_t max_len = transport::kMaxFrameLength);

// Reads one frame and parses its envelope.
// Throws IoError, FramingError (bad magic or length above max_len) or
// DecodeError. A DecodeError leaves the stream at the next frame boundary.
Envelope decode_frame(std::istream &in,
                      uint32_t max_len = transport::kMaxFrameLength);

} // namespace fleetspeak_client
