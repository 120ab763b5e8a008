#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fleetspeak_client {

// Base class for every fault raised by the connector.
//
// poisons() tells whether the fault leaves the channel in an unknown position.
// A Connection that observes such a fault refuses all further operations.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}

  virtual bool poisons() const { return false; }
};

// Channel variable missing from the environment, unparsable or not an open
// descriptor. Raised before any Connection exists.
class ChannelEnvError : public Error {
public:
  enum class Reason { NotSpecified, NotParsable, InvalidDescriptor };

  ChannelEnvError(Reason reason, const std::string &variable,
                  const std::string &detail)
      : Error(describe(reason, variable, detail)), reason_(reason),
        variable_(variable) {}

  Reason reason() const { return reason_; }
  const std::string &variable() const { return variable_; }

private:
  static std::string describe(Reason reason, const std::string &variable,
                              const std::string &detail) {
    switch (reason) {
    case Reason::NotSpecified:
      return "communication channel not specified: " + variable;
    case Reason::NotParsable:
      return "invalid communication channel value in " + variable + ": '" +
             detail + "'";
    case Reason::InvalidDescriptor:
      break;
    }
    return "invalid communication channel in " + variable + ": " + detail;
  }

  Reason reason_;
  std::string variable_;
};

// Read or write on a channel failed, including EOF in the middle of a frame.
class IoError : public Error {
public:
  explicit IoError(const std::string &what) : Error("io error: " + what) {}

  bool poisons() const override { return true; }
};

// Frame boundary could not be trusted: wrong magic or an oversized length.
class FramingError : public Error {
public:
  explicit FramingError(uint32_t magic)
      : Error("invalid magic: " + hex(magic)), magic_(magic), has_magic_(true) {
  }

  explicit FramingError(const std::string &what)
      : Error("framing error: " + what) {}

  bool poisons() const override { return true; }

  // Value read in place of the magic, when the fault is a magic mismatch.
  uint32_t magic() const { return magic_; }
  bool has_magic() const { return has_magic_; }

private:
  static std::string hex(uint32_t value) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    for (int shift = 28; shift >= 0; shift -= 4) {
      out.push_back(digits[(value >> shift) & 0xF]);
    }
    return out;
  }

  uint32_t magic_ = 0;
  bool has_magic_ = false;
};

// Bytes of a complete frame did not parse as the expected protobuf message.
class DecodeError : public Error {
public:
  explicit DecodeError(const std::string &what)
      : Error("proto decoding error: " + what) {}
};

// Outgoing message could not be encoded. Nothing has been written.
class EncodeError : public Error {
public:
  explicit EncodeError(const std::string &what)
      : Error("proto encoding error: " + what) {}
};

// Envelope parsed but breaks a protocol invariant (e.g. no source address).
class MalformedMessageError : public Error {
public:
  explicit MalformedMessageError(const std::string &what)
      : Error("malformed message: " + what) {}
};

// Operation attempted on a connection that has already failed.
class PoisonedError : public Error {
public:
  explicit PoisonedError(const std::string &cause)
      : Error("connection poisoned by an earlier failure: " + cause) {}

  bool poisons() const override { return true; }
};

} // namespace fleetspeak_client
