#pragma once

#include <string>

#include "logship/v1/envelope.pb.h"

namespace logship::envelope {

/*
  Wraps one decoded log record with the invocation that delivered it.

  The context is copied verbatim. Throws util::InvalidEntry when the
  record is not valid UTF-8 text; binary and compressed inputs must be
  decoded by the trigger adapter first.
*/
logship::v1::LogEnvelope BuildEnvelope(std::string entry, const logship::v1::InvocationContext& context);

} // namespace logship::envelope
