#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

using logship::observability::BoolField;
using logship::observability::FormatFields;
using logship::observability::IntField;
using logship::observability::StringField;

void TestFieldsKeepTheirType() {
  assert(FormatFields({}).empty());
  assert(FormatFields({IntField("attempt", 3)}) == "attempt=3");
  assert(FormatFields({IntField("offset", -12), BoolField("ok", true), BoolField("retry", false)}) ==
         "offset=-12 ok=true retry=false");
  assert(FormatFields({StringField("url", "https://cloud-collector.newrelic.com/aws/v1")}) ==
         "url=https://cloud-collector.newrelic.com/aws/v1");
}

void TestStringsAreQuotedOnlyWhenNeeded() {
  assert(FormatFields({StringField("reason", "timed out")}) == R"(reason="timed out")");
  assert(FormatFields({StringField("detail", "")}) == R"(detail="")");
  assert(FormatFields({StringField("event", R"({"a":1})")}) == R"(event="{\"a\":1}")");
  assert(FormatFields({StringField("body", "line1\nline2")}) == R"(body="line1\nline2")");
  assert(FormatFields({StringField("path", R"(C:\logs)")}) == R"(path="C:\\logs")");
}

void TestInitializeLoggingAppliesConfiguredLevel() {
  ::unsetenv("LOGSHIP_LOG_LEVEL");
  ::unsetenv("LOGSHIP_LOG_PATTERN");

  logship::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  logship::observability::InitializeLogging(config);

  assert(spdlog::default_logger()->name() == "logship");
  assert(spdlog::default_logger()->level() == spdlog::level::warn);

  ::setenv("LOGSHIP_LOG_LEVEL", "debug", 1);
  logship::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  ::unsetenv("LOGSHIP_LOG_LEVEL");
}

void TestLogWritesMessageAndFieldsAboveLevel() {
  std::ostringstream out;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto               logger = std::make_shared<spdlog::logger>("logship_capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  LOGSHIP_LOG_DEBUG("hidden", {IntField("n", 1)});
  LOGSHIP_LOG_INFO("Retrying", {IntField("attempt", 2), StringField("reason", "timed out"), BoolField("final", false)});
  LOGSHIP_LOG_ERROR("Retry limit reached. Failed to send log entry.");
  logger->flush();

  const std::string expected =
      "Retrying attempt=2 reason=\"timed out\" final=false\n"
      "Retry limit reached. Failed to send log entry.\n";
  assert(out.str() == expected);
}

} // namespace

int main() {
  TestFieldsKeepTheirType();
  TestStringsAreQuotedOnlyWhenNeeded();
  TestInitializeLoggingAppliesConfiguredLevel();
  TestLogWritesMessageAndFieldsAboveLevel();

  logship::observability::ShutdownLogging();
  std::cout << "logship_unit_logging: pass\n";
  return 0;
}
