#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "envelope.hpp"
#include "errors.hpp"
#include "packet.hpp"
#include "transport/channel_pair.hpp"

namespace fleetspeak_client {

// Bound on a single frame, matching the daemon's 2 MiB message buffer.
constexpr uint32_t kDefaultMaxFrameBytes = 2u * 1024u * 1024u;

struct ConnectionOptions {
  uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
};

// A handshaken connection to the Fleetspeak client daemon.
//
// Input and output are guarded by independent mutexes, so a heartbeat can be
// written while another thread is blocked in receive(). Each frame is written
// or read entirely under its side's lock.
//
// IoError or FramingError from any operation poisons the connection: every
// later call throws PoisonedError. Any other failure while a channel is in
// use poisons it too and surfaces as IoError. The expected reaction is to exit and let
// the daemon restart the service.
class Connection {
public:
  // Performs the handshake. Throws IoError or FramingError on failure, in
  // which case no connection exists.
  explicit Connection(transport::ChannelPair channels,
                      ConnectionOptions options = ConnectionOptions());

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  // Tells the daemon the service is alive. The required frequency comes from
  // the service configuration on the daemon side.
  void heartbeat();

  // Sends a heartbeat unless one was sent through this function less than
  // `rate` ago. Returns whether a frame was written.
  bool heartbeat_with_throttle(std::chrono::milliseconds rate);

  // Sends StartupData with this process id. Must happen soon after start, or
  // the daemon kills the service.
  void announce_startup(const std::string &version);

  template <typename T> void send(const Packet<T> &packet);

  // Blocks until a message arrives. Throws MalformedMessageError if the
  // envelope has no source service; an absent payload yields a default T.
  template <typename T> Packet<T> receive();

  void write_envelope(const Envelope &envelope);
  Envelope read_envelope();

  bool is_poisoned() const { return poisoned_.load(); }

private:
  template <typename F>
  auto guarded(std::mutex &mutex, F &&fn) -> decltype(fn());

  void check_usable() const;
  void poison(const std::string &cause);
  static void log_empty_payload(const std::string &service);

  transport::ChannelPair channels_;
  ConnectionOptions options_;

  std::mutex input_mutex_;
  std::mutex output_mutex_;

  std::atomic<bool> poisoned_{false};
  mutable std::mutex cause_mutex_;
  std::string poison_cause_;

  std::mutex throttle_mutex_;
  std::optional<std::chrono::steady_clock::time_point> last_throttled_;
};

template <typename T> void Connection::send(const Packet<T> &packet) {
  Envelope envelope;
  envelope.message_type = packet.kind.value_or(std::string());
  envelope.destination_service = packet.service;
  envelope.payload = Payload{PayloadCodec<T>::type_url(packet.data),
                             PayloadCodec<T>::encode(packet.data)};

  write_envelope(envelope);
}

template <typename T> Packet<T> Connection::receive() {
  Envelope envelope = read_envelope();

  // A message without a sender points at a deeper problem in the daemon;
  // refuse it rather than guess.
  if (!envelope.source_service || envelope.source_service->empty()) {
    throw MalformedMessageError("missing source address");
  }

  Packet<T> packet{};
  packet.service = *envelope.source_service;
  if (!envelope.message_type.empty()) {
    packet.kind = envelope.message_type;
  }

  if (envelope.payload) {
    packet.data = PayloadCodec<T>::decode(envelope.payload->value);
  } else {
    log_empty_payload(packet.service);
  }

  return packet;
}

} // namespace fleetspeak_client
