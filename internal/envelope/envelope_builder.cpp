#include "envelope_builder.hpp"

#include "internal/codec/utf8.hpp"
#include "internal/util/errors.hpp"

namespace logship::envelope {

logship::v1::LogEnvelope BuildEnvelope(std::string entry, const logship::v1::InvocationContext& context) {
  if (!codec::IsValidUtf8(entry)) {
    throw util::InvalidEntry("log entry is not valid UTF-8 (" + std::to_string(entry.size()) + " bytes)");
  }

  logship::v1::LogEnvelope envelope;
  *envelope.mutable_context() = context;
  envelope.set_entry(std::move(entry));
  return envelope;
}

} // namespace logship::envelope
