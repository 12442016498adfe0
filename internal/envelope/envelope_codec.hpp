#pragma once

#include <string>

#include "logship/v1/envelope.pb.h"

namespace logship::envelope {

/*
  Wire form expected by the ingest service:

    {"context":{"function_name":..,"invoked_function_arn":..,
                "log_group_name":..,"log_stream_name":..},
     "entry":"<text>"}

  Proto field names are kept and empty context fields still printed.
*/
std::string SerializeEnvelope(const logship::v1::LogEnvelope& envelope);

// SerializeEnvelope followed by gzip; this is the request body.
std::string EncodeEnvelope(const logship::v1::LogEnvelope& envelope);

logship::v1::LogEnvelope ParseEnvelope(const std::string& json);

} // namespace logship::envelope
