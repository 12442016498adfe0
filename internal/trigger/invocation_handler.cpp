#include "invocation_handler.hpp"

#include "internal/codec/base64.hpp"
#include "internal/codec/gzip.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace logship::trigger {

using observability::IntField;
using observability::StringField;

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

InvocationHandler::InvocationHandler(std::shared_ptr<dispatch::Dispatcher> dispatcher,
                                     std::shared_ptr<ObjectSource> objects, bool continue_on_record_failure)
    : dispatcher_(std::move(dispatcher)),
      objects_(std::move(objects)),
      continue_on_record_failure_(continue_on_record_failure) {}

InvocationSummary InvocationHandler::Handle(const std::string& event_json,
                                            const logship::v1::InvocationContext& context) {
  const auto event = ParseTriggerEvent(event_json);

  InvocationSummary summary;
  summary.kind = event.kind;

  switch (event.kind) {
    case EventKind::kCloudWatchLogs:
      HandleCloudWatch(event, context, &summary);
      break;

    case EventKind::kS3ObjectCreated:
      HandleS3(event, context, &summary);
      break;

    case EventKind::kUnsupported:
      LOGSHIP_LOG_WARN("Not supported", {StringField("event", event_json)});
      return summary;
  }

  LOGSHIP_LOG_INFO("Invocation finished",
                   {StringField("source", EventKindName(summary.kind)),
                    IntField("records", static_cast<std::int64_t>(summary.records)),
                    IntField("records_failed", static_cast<std::int64_t>(summary.records_failed)),
                    IntField("payloads_delivered", static_cast<std::int64_t>(summary.payloads.payloads_delivered)),
                    IntField("payloads_rejected", static_cast<std::int64_t>(summary.payloads.payloads_rejected))});
  return summary;
}

void InvocationHandler::HandleCloudWatch(const TriggerEvent& event, const logship::v1::InvocationContext& context,
                                         InvocationSummary* summary) {
  // CloudWatch Logs entries are compressed and encoded in Base64
  auto entry = codec::GzipDecompress(codec::Base64Decode(event.awslogs_data));
  DispatchRecord(std::move(entry), context, summary);
}

void InvocationHandler::HandleS3(const TriggerEvent& event, const logship::v1::InvocationContext& context,
                                 InvocationSummary* summary) {
  auto body = objects_->Fetch(event.object.bucket, event.object.key);
  if (EndsWith(event.object.key, ".gz")) {
    body = codec::GzipDecompress(body);
  }

  LOGSHIP_LOG_DEBUG("Fetched object", {StringField("bucket", event.object.bucket), StringField("key", event.object.key),
                                       IntField("bytes", static_cast<std::int64_t>(body.size()))});

  // There are many log entries in a log file, so send them one by one
  for (auto& line : SplitLines(body)) {
    DispatchRecord(std::move(line), context, summary);
  }
}

void InvocationHandler::DispatchRecord(std::string record, const logship::v1::InvocationContext& context,
                                       InvocationSummary* summary) {
  ++summary->records;
  try {
    summary->payloads += dispatcher_->Dispatch(std::move(record), context);
  } catch (const util::RetriesExhausted& e) {
    if (!continue_on_record_failure_) {
      throw;
    }
    ++summary->records_failed;
    LOGSHIP_LOG_ERROR("Record failed, continuing", {StringField("error", e.what())});
  } catch (const util::Throttled& e) {
    if (!continue_on_record_failure_) {
      throw;
    }
    ++summary->records_failed;
    LOGSHIP_LOG_ERROR("Record throttled, continuing", {StringField("error", e.what())});
  }
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;

  std::size_t start = 0;
  std::size_t i     = 0;
  while (i < text.size()) {
    const char ch = text[i];
    if (ch == '\n' || ch == '\r') {
      if (i > start) {
        lines.emplace_back(text, start, i - start);
      }
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
    ++i;
  }
  if (start < text.size()) {
    lines.emplace_back(text, start, text.size() - start);
  }
  return lines;
}

} // namespace logship::trigger
