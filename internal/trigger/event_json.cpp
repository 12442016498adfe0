#include "event_json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace logship::trigger {
namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Field(const Struct& object, const std::string& name) {
  const auto it = object.fields().find(name);
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

const Struct* StructField(const Struct& object, const std::string& name) {
  const auto* value = Field(object, name);
  if (value == nullptr || !value->has_struct_value()) {
    return nullptr;
  }
  return &value->struct_value();
}

std::string StringField(const Struct& object, const std::string& name) {
  const auto* value = Field(object, name);
  if (value == nullptr || value->kind_case() != Value::kStringValue) {
    return {};
  }
  return value->string_value();
}

int HexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  return -1;
}

} // namespace

TriggerEvent ParseTriggerEvent(const std::string& json) {
  Struct event;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &event);
  if (!status.ok()) {
    throw util::DecodeError("Invalid invocation event: " + std::string(status.message()));
  }

  TriggerEvent result;

  if (const auto* awslogs = StructField(event, "awslogs")) {
    result.kind         = EventKind::kCloudWatchLogs;
    result.awslogs_data = StringField(*awslogs, "data");
    return result;
  }

  const auto* records = Field(event, "Records");
  if (records == nullptr || !records->has_list_value() || records->list_value().values_size() == 0) {
    return result;
  }

  const auto& first = records->list_value().values(0);
  if (!first.has_struct_value()) {
    return result;
  }

  const auto* s3 = StructField(first.struct_value(), "s3");
  if (s3 == nullptr || StringField(first.struct_value(), "eventName").find("ObjectCreated") == std::string::npos) {
    return result;
  }

  const auto* bucket = StructField(*s3, "bucket");
  const auto* object = StructField(*s3, "object");
  if (bucket == nullptr || object == nullptr) {
    throw util::DecodeError("S3 event without bucket or object");
  }

  result.kind          = EventKind::kS3ObjectCreated;
  result.object.bucket = StringField(*bucket, "name");
  result.object.key    = DecodeObjectKey(StringField(*object, "key"));
  return result;
}

const char* EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kCloudWatchLogs:
      return "cw_logs";
    case EventKind::kS3ObjectCreated:
      return "s3";
    case EventKind::kUnsupported:
      break;
  }
  return "unknown";
}

std::string DecodeObjectKey(const std::string& key) {
  std::string decoded;
  decoded.reserve(key.size());

  for (std::size_t i = 0; i < key.size(); ++i) {
    const char ch = key[i];
    if (ch == '+') {
      decoded.push_back(' ');
    } else if (ch == '%' && i + 2 < key.size() && HexDigit(key[i + 1]) >= 0 && HexDigit(key[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(HexDigit(key[i + 1]) * 16 + HexDigit(key[i + 2])));
      i += 2;
    } else {
      decoded.push_back(ch);
    }
  }
  return decoded;
}

} // namespace logship::trigger
