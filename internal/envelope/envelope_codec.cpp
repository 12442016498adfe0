#include "envelope_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/codec/gzip.hpp"
#include "internal/util/errors.hpp"

namespace logship::envelope {

std::string SerializeEnvelope(const logship::v1::LogEnvelope& envelope) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(envelope, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize envelope: " + std::string(status.message()));
  }
  return json;
}

std::string EncodeEnvelope(const logship::v1::LogEnvelope& envelope) {
  return codec::GzipCompress(SerializeEnvelope(envelope));
}

logship::v1::LogEnvelope ParseEnvelope(const std::string& json) {
  logship::v1::LogEnvelope envelope;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, options);
  if (!status.ok()) {
    throw util::DecodeError("Invalid envelope: " + std::string(status.message()));
  }
  return envelope;
}

} // namespace logship::envelope
