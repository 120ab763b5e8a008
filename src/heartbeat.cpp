#include "heartbeat.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace fleetspeak_client {

HeartbeatLoop::HeartbeatLoop(Connection &connection,
                             std::chrono::milliseconds rate)
    : connection_(connection), rate_(rate) {
  if (rate_.count() <= 0) {
    throw std::invalid_argument("heartbeat rate must be positive");
  }
  thread_ = std::thread(&HeartbeatLoop::run, this);
}

HeartbeatLoop::~HeartbeatLoop() { stop(); }

void HeartbeatLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cancel_cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
}

void HeartbeatLoop::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!cancelled_) {
    lock.unlock();
    try {
      connection_.heartbeat();
    } catch (const std::exception &e) {
      std::cerr << "[Heartbeat] heartbeat failed, stopping loop: " << e.what()
                << std::endl;
      return;
    }
    lock.lock();

    cancel_cv_.wait_for(lock, rate_, [this] { return cancelled_; });
  }
}

} // namespace fleetspeak_client
