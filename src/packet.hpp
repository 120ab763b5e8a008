#pragma once

#include <optional>
#include <string>
#include <type_traits>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "errors.hpp"

namespace fleetspeak_client {

constexpr const char *kTypeUrlPrefix = "type.googleapis.com";

// A message exchanged with a server-side service.
//
// On send, `service` is the destination; on receive it is the sender. `kind`
// maps to the envelope's message_type, which Fleetspeak itself ignores.
template <typename T> struct Packet {
  std::string service;
  std::optional<std::string> kind;
  T data;
};

// Type URL of a protobuf message, as google.protobuf.Any expects it.
inline std::string type_url(const google::protobuf::Message &message) {
  return std::string(kTypeUrlPrefix) + "/" +
         std::string(message.GetDescriptor()->full_name());
}

// Maps a packet's data to and from the bytes of Message.data.
template <typename T, typename Enable = void> struct PayloadCodec;

// Protobuf messages travel serialized, tagged with their type URL.
template <typename T>
struct PayloadCodec<
    T, std::enable_if_t<std::is_base_of<google::protobuf::Message, T>::value>> {
  static std::string type_url(const T &data) {
    return fleetspeak_client::type_url(data);
  }

  static std::string encode(const T &data) {
    std::string bytes;
    if (!data.SerializeToString(&bytes)) {
      throw EncodeError("failed to serialize " +
                        std::string(data.GetDescriptor()->full_name()));
    }
    return bytes;
  }

  static T decode(const std::string &bytes) {
    T data;
    if (!data.ParseFromString(bytes)) {
      throw DecodeError("failed to parse " +
                        std::string(data.GetDescriptor()->full_name()));
    }
    return data;
  }
};

// Raw bytes travel as they are, with no type URL.
template <> struct PayloadCodec<std::string> {
  static std::string type_url(const std::string &) { return std::string(); }
  static std::string encode(const std::string &data) { return data; }
  static std::string decode(const std::string &bytes) { return bytes; }
};

} // namespace fleetspeak_client
