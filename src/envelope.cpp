#include "envelope.hpp"

#include "errors.hpp"

namespace fleetspeak_client {

fleetspeak::Message to_proto(const Envelope &envelope) {
  fleetspeak::Message msg;
  msg.set_message_type(envelope.message_type);
  msg.mutable_destination()->set_service_name(envelope.destination_service);
  if (envelope.source_service) {
    msg.mutable_source()->set_service_name(*envelope.source_service);
  }
  if (envelope.payload) {
    msg.mutable_data()->set_type_url(envelope.payload->type_url);
    msg.mutable_data()->set_value(envelope.payload->value);
  }
  return msg;
}

Envelope from_proto(const fleetspeak::Message &message) {
  Envelope envelope;
  envelope.message_type = message.message_type();
  if (message.has_destination()) {
    envelope.destination_service = message.destination().service_name();
  }
  if (message.has_source()) {
    envelope.source_service = message.source().service_name();
  }
  if (message.has_data()) {
    envelope.payload =
        Payload{message.data().type_url(), message.data().value()};
  }
  return envelope;
}

std::vector<uint8_t> encode_frame(const Envelope &envelope, uint32_t max_len) {
  if (envelope.destination_service.empty()) {
    throw EncodeError("missing destination service");
  }

  const fleetspeak::Message msg = to_proto(envelope);
  const size_t size = msg.ByteSizeLong();
  if (size > max_len) {
    throw EncodeError("message of " + std::to_string(size) +
                      " bytes exceeds max frame of " + std::to_string(max_len));
  }

  std::string bytes;
  if (!msg.SerializeToString(&bytes)) {
    throw EncodeError("failed to serialize fleetspeak.Message");
  }

  return transport::build_frame(bytes, max_len);
}

Envelope decode_frame(std::istream &in, uint32_t max_len) {
  const std::string bytes = transport::read_frame(in, max_len);

  fleetspeak::Message msg;
  if (!msg.ParseFromString(bytes)) {
    throw DecodeError("failed to parse fleetspeak.Message (" +
                      std::to_string(bytes.size()) + " bytes)");
  }
  return from_proto(msg);
}

} // namespace fleetspeak_client
