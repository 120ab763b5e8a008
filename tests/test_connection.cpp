/**
 * @file test_connection.cpp
 * @brief Tests for connection.hpp
 */

#include "connection.hpp"
#include "errors.hpp"
#include "fleetspeak_channel/channel.pb.h"
#include "transport/fd_stream.hpp"

#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <google/protobuf/wrappers.pb.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using fleetspeak_client::Connection;
using fleetspeak_client::DecodeError;
using fleetspeak_client::EncodeError;
using fleetspeak_client::Envelope;
using fleetspeak_client::FramingError;
using fleetspeak_client::IoError;
using fleetspeak_client::MalformedMessageError;
using fleetspeak_client::Packet;
using fleetspeak_client::PoisonedError;
using test_support::MemoryChannels;

namespace {

// Handshake reply followed by `frames`.
MemoryChannels script(const std::string &frames = std::string()) {
  return MemoryChannels(test_support::magic() + frames);
}

std::string string_value(const std::string &text) {
  google::protobuf::StringValue value;
  value.set_value(text);
  return value.SerializeAsString();
}

} // namespace

TEST_CASE("connection - send builds the envelope from the packet",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  Packet<std::string> packet;
  packet.service = "greeter";
  packet.data = std::string("\x01\x02\x03\x04\x05", 5);
  conn.send(packet);

  const std::vector<Envelope> frames = test_support::written_frames(*output);
  REQUIRE(frames.size() == 1U);
  REQUIRE(frames[0].destination_service == "greeter");
  REQUIRE(frames[0].message_type.empty());
  REQUIRE_FALSE(frames[0].source_service.has_value());
  REQUIRE(frames[0].payload.has_value());
  REQUIRE(frames[0].payload->value == packet.data);
}

TEST_CASE("connection - send of a protobuf packet carries kind and type url",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  Packet<google::protobuf::StringValue> packet;
  packet.service = "greeter";
  packet.kind = std::string("greeting");
  packet.data.set_value("Hello Alice!");
  conn.send(packet);

  const std::vector<Envelope> frames = test_support::written_frames(*output);
  REQUIRE(frames.size() == 1U);
  REQUIRE(frames[0].message_type == "greeting");
  REQUIRE(frames[0].payload->type_url ==
          "type.googleapis.com/google.protobuf.StringValue");
  REQUIRE(frames[0].payload->value == string_value("Hello Alice!"));
}

TEST_CASE("connection - send without a service writes nothing",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  Packet<std::string> packet;
  packet.data = "orphan";
  REQUIRE_THROWS_AS(conn.send(packet), EncodeError);
  REQUIRE_FALSE(conn.is_poisoned());
  REQUIRE(test_support::written_frames(*output).empty());
}

TEST_CASE("connection - heartbeat and startup go to the system service",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  conn.announce_startup("0.0.1");
  conn.heartbeat();

  const std::vector<Envelope> frames = test_support::written_frames(*output);
  REQUIRE(frames.size() == 2U);

  REQUIRE(frames[0].message_type == "StartupData");
  REQUIRE(frames[0].destination_service == "system");
  fleetspeak::channel::StartupData startup;
  REQUIRE(startup.ParseFromString(frames[0].payload->value));
  REQUIRE(startup.pid() == static_cast<int64_t>(::getpid()));
  REQUIRE(startup.version() == "0.0.1");

  REQUIRE(frames[1].message_type == "Heartbeat");
  REQUIRE(frames[1].destination_service == "system");
  REQUIRE_FALSE(frames[1].payload.has_value());
}

TEST_CASE("connection - receive decodes the sender, kind and data",
          "[connection]") {
  const std::string value = string_value("Alice");
  MemoryChannels channels = script(
      test_support::frame_of(test_support::inbound("greeter", "request", &value)));
  Connection conn(std::move(channels.pair));

  const Packet<google::protobuf::StringValue> packet =
      conn.receive<google::protobuf::StringValue>();
  REQUIRE(packet.service == "greeter");
  REQUIRE(packet.kind == std::string("request"));
  REQUIRE(packet.data.value() == "Alice");
}

TEST_CASE("connection - receive maps an empty message type to no kind",
          "[connection]") {
  const std::string value = "raw";
  MemoryChannels channels =
      script(test_support::frame_of(test_support::inbound("greeter", "", &value)));
  Connection conn(std::move(channels.pair));

  const Packet<std::string> packet = conn.receive<std::string>();
  REQUIRE_FALSE(packet.kind.has_value());
  REQUIRE(packet.data == "raw");
}

TEST_CASE("connection - missing source is a malformed message",
          "[connection]") {
  const std::string value = string_value("x");
  Envelope no_source = test_support::inbound("", "request", &value);
  no_source.source_service.reset();

  const std::string value2 = "second";
  MemoryChannels channels =
      script(test_support::frame_of(no_source) +
             test_support::frame_of(
                 test_support::inbound("greeter", "", &value2)));
  Connection conn(std::move(channels.pair));

  REQUIRE_THROWS_AS(conn.receive<google::protobuf::StringValue>(),
                    MalformedMessageError);

  // The frame was consumed whole; the connection stays usable.
  REQUIRE_FALSE(conn.is_poisoned());
  REQUIRE(conn.receive<std::string>().data == "second");
}

TEST_CASE("connection - missing payload yields the default value",
          "[connection]") {
  MemoryChannels channels = script(
      test_support::frame_of(test_support::inbound("greeter", "ping", nullptr)) +
      test_support::frame_of(test_support::inbound("greeter", "ping", nullptr)));
  Connection conn(std::move(channels.pair));

  const auto proto_packet = conn.receive<google::protobuf::StringValue>();
  REQUIRE(proto_packet.service == "greeter");
  REQUIRE(proto_packet.data.value().empty());

  const auto raw_packet = conn.receive<std::string>();
  REQUIRE(raw_packet.data.empty());
}

TEST_CASE("connection - undecodable payload does not poison",
          "[connection]") {
  const std::string garbage("\xFF\xFF\xFF", 3);
  const std::string good = string_value("ok");
  MemoryChannels channels = script(
      test_support::frame_of(test_support::inbound("greeter", "", &garbage)) +
      test_support::frame_of(test_support::inbound("greeter", "", &good)));
  Connection conn(std::move(channels.pair));

  REQUIRE_THROWS_AS(conn.receive<google::protobuf::StringValue>(),
                    DecodeError);
  REQUIRE_FALSE(conn.is_poisoned());
  REQUIRE(conn.receive<google::protobuf::StringValue>().data.value() == "ok");
}

TEST_CASE("connection - io fault poisons every later operation",
          "[connection]") {
  // Nothing after the handshake: the next read hits EOF.
  MemoryChannels channels = script();
  Connection conn(std::move(channels.pair));

  REQUIRE_THROWS_AS(conn.receive<std::string>(), IoError);
  REQUIRE(conn.is_poisoned());

  Packet<std::string> packet;
  packet.service = "greeter";
  REQUIRE_THROWS_AS(conn.heartbeat(), PoisonedError);
  REQUIRE_THROWS_AS(conn.announce_startup("1"), PoisonedError);
  REQUIRE_THROWS_AS(conn.send(packet), PoisonedError);
  REQUIRE_THROWS_AS(conn.receive<std::string>(), PoisonedError);
}

TEST_CASE("connection - write fault poisons the connection",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  output->setstate(std::ios::badbit);
  REQUIRE_THROWS_AS(conn.heartbeat(), IoError);
  REQUIRE(conn.is_poisoned());

  output->clear();
  REQUIRE_THROWS_AS(conn.heartbeat(), PoisonedError);
}

TEST_CASE("connection - bad frame magic poisons the connection",
          "[connection]") {
  const std::string value = "x";
  std::string frame =
      test_support::frame_of(test_support::inbound("greeter", "", &value));
  frame.replace(frame.size() - 4, 4, test_support::le32(0xF1EE1337u));

  MemoryChannels channels = script(frame);
  Connection conn(std::move(channels.pair));

  try {
    conn.receive<std::string>();
    FAIL("expected FramingError");
  } catch (const FramingError &e) {
    REQUIRE(e.magic() == 0xF1EE1337u);
  }
  REQUIRE(conn.is_poisoned());
  REQUIRE_THROWS_AS(conn.heartbeat(), PoisonedError);
}

TEST_CASE("connection - inbound frame above the configured bound poisons",
          "[connection]") {
  const std::string value(256, 'x');
  MemoryChannels channels = script(
      test_support::frame_of(test_support::inbound("greeter", "", &value)));

  fleetspeak_client::ConnectionOptions options;
  options.max_frame_bytes = 64;
  Connection conn(std::move(channels.pair), options);

  REQUIRE_THROWS_AS(conn.receive<std::string>(), FramingError);
  REQUIRE(conn.is_poisoned());
}

TEST_CASE("connection - outbound frame above the configured bound is refused",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;

  fleetspeak_client::ConnectionOptions options;
  options.max_frame_bytes = 64;
  Connection conn(std::move(channels.pair), options);

  Packet<std::string> packet;
  packet.service = "greeter";
  packet.data = std::string(256, 'x');
  REQUIRE_THROWS_AS(conn.send(packet), EncodeError);
  REQUIRE_FALSE(conn.is_poisoned());
  REQUIRE(test_support::written_frames(*output).empty());
}

TEST_CASE("connection - throttled heartbeat respects the rate",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  SECTION("two calls within the rate send one frame") {
    REQUIRE(conn.heartbeat_with_throttle(std::chrono::seconds(60)));
    REQUIRE_FALSE(conn.heartbeat_with_throttle(std::chrono::seconds(60)));
    REQUIRE(test_support::written_frames(*output).size() == 1U);
  }

  SECTION("two calls further apart than the rate send two frames") {
    const auto rate = std::chrono::milliseconds(20);
    REQUIRE(conn.heartbeat_with_throttle(rate));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    REQUIRE(conn.heartbeat_with_throttle(rate));
    REQUIRE(test_support::written_frames(*output).size() == 2U);
  }

  SECTION("plain heartbeats do not reset the throttle") {
    REQUIRE(conn.heartbeat_with_throttle(std::chrono::seconds(60)));
    conn.heartbeat();
    REQUIRE_FALSE(conn.heartbeat_with_throttle(std::chrono::seconds(60)));
    REQUIRE(test_support::written_frames(*output).size() == 2U);
  }
}

TEST_CASE("connection - concurrent writers never tear frames",
          "[connection]") {
  MemoryChannels channels = script();
  auto *output = channels.output;
  Connection conn(std::move(channels.pair));

  constexpr int kPerThread = 200;
  std::thread heartbeats([&] {
    for (int i = 0; i < kPerThread; ++i) {
      conn.heartbeat();
    }
  });
  std::thread sends([&] {
    Packet<std::string> packet;
    packet.service = "greeter";
    packet.data = std::string(1000, 'd');
    for (int i = 0; i < kPerThread; ++i) {
      conn.send(packet);
    }
  });
  heartbeats.join();
  sends.join();

  const std::vector<Envelope> frames = test_support::written_frames(*output);
  REQUIRE(frames.size() == static_cast<size_t>(2 * kPerThread));

  int heartbeat_count = 0;
  for (const Envelope &e : frames) {
    if (e.message_type == "Heartbeat") {
      ++heartbeat_count;
    } else {
      REQUIRE(e.payload->value.size() == 1000U);
    }
  }
  REQUIRE(heartbeat_count == kPerThread);
}

TEST_CASE("connection - writing to a closed pipe poisons instead of killing",
          "[connection]") {
  test_support::Pipe from_client;

  fleetspeak_client::transport::ChannelPair pair;
  pair.input = std::make_unique<std::stringstream>(
      test_support::magic(), std::ios::in | std::ios::out | std::ios::binary);
  pair.output = std::make_unique<fleetspeak_client::transport::FdOutputStream>(
      from_client.write_fd(), false);
  Connection conn(std::move(pair));

  from_client.close_read();

  try {
    conn.heartbeat();
    FAIL("expected IoError");
  } catch (const IoError &e) {
    REQUIRE(std::string(e.what()).find(std::strerror(EPIPE)) !=
            std::string::npos);
  }
  REQUIRE(conn.is_poisoned());
  REQUIRE_THROWS_AS(conn.heartbeat(), PoisonedError);
}

TEST_CASE("connection - failed read reports the system error",
          "[connection]") {
  test_support::Pipe to_client;
  to_client.write_all(test_support::magic());

  fleetspeak_client::transport::ChannelPair pair;
  pair.input = std::make_unique<fleetspeak_client::transport::FdInputStream>(
      to_client.read_fd(), false);
  pair.output = std::make_unique<std::stringstream>(
      std::ios::in | std::ios::out | std::ios::binary);
  Connection conn(std::move(pair));

  // Pull the descriptor out from under the stream.
  ::close(to_client.release_read());

  try {
    conn.receive<std::string>();
    FAIL("expected IoError");
  } catch (const IoError &e) {
    REQUIRE(std::string(e.what()).find(std::strerror(EBADF)) !=
            std::string::npos);
  }
  REQUIRE(conn.is_poisoned());
}

TEST_CASE("connection - unexpected stream exception becomes a poisoning "
          "io fault",
          "[connection]") {
  MemoryChannels channels = script();
  // A read past the handshake throws std::ios_base::failure.
  channels.input->exceptions(std::ios::failbit);
  Connection conn(std::move(channels.pair));

  try {
    conn.receive<std::string>();
    FAIL("expected IoError");
  } catch (const IoError &e) {
    REQUIRE(e.poisons());
    REQUIRE(std::string(e.what()).find("unexpected failure") !=
            std::string::npos);
  }
  REQUIRE(conn.is_poisoned());
  REQUIRE_THROWS_AS(conn.receive<std::string>(), PoisonedError);
}
