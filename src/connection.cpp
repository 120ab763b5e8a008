#include "connection.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include "system_messages.hpp"
#include "transport/framing.hpp"

namespace fleetspeak_client {

static int64_t current_pid() {
#ifdef _WIN32
  return static_cast<int64_t>(_getpid());
#else
  return static_cast<int64_t>(::getpid());
#endif
}

Connection::Connection(transport::ChannelPair channels,
                       ConnectionOptions options)
    : channels_(std::move(channels)), options_(options) {
  if (!channels_.input || !channels_.output) {
    throw std::invalid_argument("Connection requires both input and output");
  }

  transport::handshake(*channels_.input, *channels_.output);
  std::cerr << "[Connection] handshake successful" << std::endl;
}

template <typename F>
auto Connection::guarded(std::mutex &mutex, F &&fn) -> decltype(fn()) {
  std::lock_guard<std::mutex> lock(mutex);
  check_usable();

  try {
    return fn();
  } catch (const Error &e) {
    if (e.poisons()) {
      poison(e.what());
    }
    throw;
  } catch (const std::exception &e) {
    // Stream position is unknown after an unexpected failure mid-frame.
    const std::string cause = std::string("unexpected failure: ") + e.what();
    poison(cause);
    throw IoError(cause);
  }
}

void Connection::heartbeat() {
  write_envelope(system_messages::make_heartbeat());
}

bool Connection::heartbeat_with_throttle(std::chrono::milliseconds rate) {
  std::lock_guard<std::mutex> lock(throttle_mutex_);

  if (last_throttled_ &&
      std::chrono::steady_clock::now() - *last_throttled_ < rate) {
    return false;
  }

  heartbeat();
  last_throttled_ = std::chrono::steady_clock::now();
  return true;
}

void Connection::announce_startup(const std::string &version) {
  write_envelope(system_messages::make_startup(version, current_pid()));
}

void Connection::write_envelope(const Envelope &envelope) {
  check_usable();

  // Encode outside the lock: an EncodeError must not touch the stream.
  const std::vector<uint8_t> frame =
      encode_frame(envelope, options_.max_frame_bytes);

  guarded(output_mutex_,
          [&] { transport::write_frame(*channels_.output, frame); });
}

Envelope Connection::read_envelope() {
  return guarded(input_mutex_, [&] {
    return decode_frame(*channels_.input, options_.max_frame_bytes);
  });
}

void Connection::check_usable() const {
  if (!poisoned_.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(cause_mutex_);
  throw PoisonedError(poison_cause_);
}

void Connection::poison(const std::string &cause) {
  {
    std::lock_guard<std::mutex> lock(cause_mutex_);
    if (poisoned_.load()) {
      return;
    }
    poison_cause_ = cause;
    poisoned_.store(true);
  }
  std::cerr << "[Connection] connection failure, poisoned: " << cause
            << std::endl;
}

void Connection::log_empty_payload(const std::string &service) {
  std::cerr << "[Connection] empty message from '" << service << "'"
            << std::endl;
}

} // namespace fleetspeak_client
