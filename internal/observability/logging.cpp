#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace logship::observability {
namespace {

std::string ResolveLevel(const logship::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("LOGSHIP_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const logship::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("LOGSHIP_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool NeedsQuotes(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char ch : value) {
    if (ch == ' ' || ch == '"' || ch == '=' || ch == '\\' || static_cast<unsigned char>(ch) < 0x20) {
      return true;
    }
  }
  return false;
}

void AppendQuoted(const std::string& value, std::string* out) {
  out->push_back('"');
  for (char ch : value) {
    switch (ch) {
      case '"':
        out->append("\\\"");
        break;
      case '\\':
        out->append("\\\\");
        break;
      case '\n':
        out->append("\\n");
        break;
      case '\r':
        out->append("\\r");
        break;
      case '\t':
        out->append("\\t");
        break;
      default:
        out->push_back(ch);
    }
  }
  out->push_back('"');
}

struct ValueRenderer {
  std::string* out;

  void operator()(const std::string& value) const {
    if (NeedsQuotes(value)) {
      AppendQuoted(value, out);
    } else {
      out->append(value);
    }
  }

  void operator()(std::int64_t value) const {
    out->append(std::to_string(value));
  }

  void operator()(bool value) const {
    out->append(value ? "true" : "false");
  }
};

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), value};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    std::visit(ValueRenderer{&out}, field.value);
  }
  return out;
}

void InitializeLogging(const logship::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("logship");
  if (!logger) {
    logger = spdlog::stdout_color_mt("logship");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(fields));
}

} // namespace logship::observability
