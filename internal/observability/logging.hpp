#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace logship::runtime::config {
class RuntimeConfig;
}

namespace logship::observability {

/*
  One key=value pair appended to a log line.

  Values keep their type until the line is rendered; strings are quoted
  only when they would otherwise break the key=value layout.
*/
struct LogField {
  using Value = std::variant<std::string, std::int64_t, bool>;

  std::string key;
  Value       value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Renders `k1=v1 k2="v 2"`.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const logship::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace logship::observability

#define LOGSHIP_LOG_DEBUG(message, ...) ::logship::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define LOGSHIP_LOG_INFO(message, ...) ::logship::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define LOGSHIP_LOG_WARN(message, ...) ::logship::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define LOGSHIP_LOG_ERROR(message, ...) ::logship::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
