#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "connection.hpp"

namespace fleetspeak_client {

// Background thread sending heartbeats every `rate` until stopped.
//
// The first heartbeat goes out immediately. A failed heartbeat is logged and
// ends the loop; the caller sees the underlying fault on its next use of the
// connection. Destruction stops the loop and waits for the thread.
class HeartbeatLoop {
public:
  HeartbeatLoop(Connection &connection, std::chrono::milliseconds rate);
  ~HeartbeatLoop();

  HeartbeatLoop(const HeartbeatLoop &) = delete;
  HeartbeatLoop &operator=(const HeartbeatLoop &) = delete;

  // Idempotent. Returns once no further heartbeat can be written.
  void stop();

private:
  void run();

  Connection &connection_;
  std::chrono::milliseconds rate_;

  std::mutex mutex_;
  std::condition_variable cancel_cv_;
  bool cancelled_ = false;

  std::thread thread_;
};

// Receives one message, heartbeating at `rate` while waiting for it.
//
// Meant for a service's main loop, when nothing happens until the server
// sends a request. No heartbeat is written once this returns or throws.
template <typename T>
Packet<T> collect(Connection &connection, std::chrono::milliseconds rate) {
  HeartbeatLoop heartbeats(connection, rate);
  return connection.receive<T>();
}

} // namespace fleetspeak_client
