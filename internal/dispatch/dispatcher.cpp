#include "dispatcher.hpp"

#include "internal/classify/entry_classifier.hpp"
#include "internal/envelope/envelope_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/split/payload_splitter.hpp"
#include "internal/util/errors.hpp"

namespace logship::dispatch {

using observability::IntField;
using observability::StringField;

Dispatcher::Dispatcher(std::shared_ptr<transport::IngestTransport> transport, std::size_t max_payload_bytes)
    : transport_(std::move(transport)),
      max_payload_bytes_(max_payload_bytes) {}

DispatchReport Dispatcher::Dispatch(std::string raw_record, const logship::v1::InvocationContext& context) {
  DispatchReport report;

  logship::v1::LogEnvelope envelope;
  try {
    envelope = envelope::BuildEnvelope(std::move(raw_record), context);
  } catch (const util::InvalidEntry& e) {
    LOGSHIP_LOG_ERROR("Dropping log entry", {StringField("error", e.what())});
    ++report.payloads_rejected;
    return report;
  }

  const auto category = classify::Classify(envelope.entry());
  const auto url      = transport_->UrlFor(category);

  auto payloads = split::ToPayloads(std::move(envelope), max_payload_bytes_);

  std::size_t index = 0;
  while (true) {
    std::optional<split::Payload> payload;
    try {
      payload = payloads.Next();
    } catch (const util::UnsplittableEntry& e) {
      LOGSHIP_LOG_ERROR("Dropping oversized log entry", {StringField("category", classify::CategoryName(category)),
                                                        StringField("error", e.what())});
      ++report.payloads_rejected;
      break;
    } catch (const util::PayloadTooLarge& e) {
      LOGSHIP_LOG_ERROR("Dropping oversized log event", {StringField("category", classify::CategoryName(category)),
                                                        StringField("error", e.what())});
      ++report.payloads_rejected;
      break;
    }

    if (!payload) {
      break;
    }

    const auto result = transport_->Send(category, *payload);
    LOGSHIP_LOG_DEBUG("Payload handled", {IntField("payload", static_cast<std::int64_t>(index)),
                                          StringField("status", transport::StatusName(result.status)),
                                          IntField("attempts", result.attempts)});

    switch (result.status) {
      case transport::DeliveryStatus::kDelivered:
        ++report.payloads_delivered;
        break;

      case transport::DeliveryStatus::kRejected:
        LOGSHIP_LOG_ERROR(result.detail, {StringField("url", url), IntField("payload", static_cast<std::int64_t>(index)),
                                          StringField("reason", transport::ReasonName(result.reason))});
        ++report.payloads_rejected;
        break;

      case transport::DeliveryStatus::kThrottled:
        LOGSHIP_LOG_ERROR("Rate limit reached. Failed to send log entry.", {StringField("url", url)});
        throw util::Throttled(result.detail);

      case transport::DeliveryStatus::kExhausted:
        LOGSHIP_LOG_ERROR("Retry limit reached. Failed to send log entry.",
                          {StringField("url", url), IntField("attempts", result.attempts),
                           StringField("last_error", result.detail)});
        throw util::RetriesExhausted("gave up after " + std::to_string(result.attempts) +
                                     " attempts: " + result.detail);
    }

    ++index;
  }

  return report;
}

} // namespace logship::dispatch
