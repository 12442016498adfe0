#pragma once

#include <string>

namespace logship::trigger {

enum class EventKind {
  kCloudWatchLogs,
  kS3ObjectCreated,
  kUnsupported,
};

struct S3ObjectRef {
  std::string bucket;
  std::string key;
};

struct TriggerEvent {
  EventKind   kind{EventKind::kUnsupported};
  std::string awslogs_data; // base64(gzip(text)), CloudWatch only
  S3ObjectRef object;       // S3 only, key already URL-decoded
};

/*
  Recognizes the invocation event:
    {"awslogs":{"data":"..."}}                                -> CloudWatch Logs
    {"Records":[{"eventName":"ObjectCreated:*","s3":{...}}]}  -> S3
  anything else is kUnsupported. Throws util::DecodeError when the
  input is not a JSON object.
*/
TriggerEvent ParseTriggerEvent(const std::string& json);

const char* EventKindName(EventKind kind);

// S3 event keys are form encoded ('+' for space, %XX escapes).
std::string DecodeObjectKey(const std::string& key);

} // namespace logship::trigger
