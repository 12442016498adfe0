#include "delivery_settings.hpp"

#include <algorithm>
#include <cctype>

#include <google/protobuf/util/time_util.h>

#include "internal/util/errors.hpp"

namespace logship::config {
namespace {

using google::protobuf::util::TimeUtil;

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return value;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

} // namespace

std::string ResolveIngestHost(const std::string& region, const std::string& license_key, bool infer_from_license_key,
                              Region* resolved) {
  std::string selector = region;

  if (selector.empty()) {
    if (!infer_from_license_key) {
      throw util::ConfigError("ingest.region is required (US, EU or an http(s) URL; or set NR_REGION)");
    }
    selector = StartsWith(license_key, "eu") ? "EU" : "US";
  }

  const auto upper = ToUpper(selector);
  if (upper == "US") {
    if (resolved) *resolved = Region::kUs;
    return kUsIngestHost;
  }
  if (upper == "EU") {
    if (resolved) *resolved = Region::kEu;
    return kEuIngestHost;
  }

  if (StartsWith(selector, "https://") || StartsWith(selector, "http://")) {
    while (selector.size() > 1 && selector.back() == '/') {
      selector.pop_back();
    }
    if (resolved) *resolved = Region::kCustom;
    return selector;
  }

  throw util::ConfigError("ingest.region must be US, EU or an http(s) URL, got '" + region + "'");
}

DeliverySettings ResolveDeliverySettings(const logship::runtime::config::RuntimeConfig& config) {
  DeliverySettings settings;

  const auto& ingest = config.ingest();
  if (ingest.license_key().empty()) {
    throw util::ConfigError("ingest.license_key is required (or set LICENSE_KEY)");
  }
  settings.license_key = ingest.license_key();
  settings.ingest_host =
      ResolveIngestHost(ingest.region(), ingest.license_key(), ingest.infer_region_from_license_key(), &settings.region);
  if (!ingest.service_version().empty()) {
    settings.service_version = ingest.service_version();
  }

  if (config.payload().max_bytes() != 0) {
    settings.max_payload_bytes = static_cast<std::size_t>(config.payload().max_bytes());
  }

  const auto& retry = config.retry();
  if (retry.max_attempts() != 0) {
    settings.retry.max_attempts = retry.max_attempts();
  }
  if (retry.has_initial_backoff()) {
    settings.retry.initial_backoff = ToMillis(retry.initial_backoff());
    if (settings.retry.initial_backoff.count() < 0) {
      throw util::ConfigError("retry.initial_backoff must not be negative");
    }
  }
  if (retry.backoff_multiplier() != 0) {
    if (retry.backoff_multiplier() < 1.0) {
      throw util::ConfigError("retry.backoff_multiplier must be >= 1");
    }
    settings.retry.multiplier = retry.backoff_multiplier();
  }

  const auto& http = config.http();
  if (http.has_connect_timeout()) {
    settings.connect_timeout = ToMillis(http.connect_timeout());
  }
  if (http.has_request_timeout()) {
    settings.request_timeout = ToMillis(http.request_timeout());
  }
  if (settings.connect_timeout.count() <= 0 || settings.request_timeout.count() <= 0) {
    throw util::ConfigError("http timeouts must be positive");
  }

  settings.continue_on_record_failure = config.delivery().continue_on_record_failure();
  return settings;
}

logship::v1::InvocationContext ResolveInvocationContext(const logship::runtime::config::RuntimeConfig& config) {
  const auto& invocation = config.invocation();
  if (invocation.function_name().empty()) {
    throw util::ConfigError("invocation.function_name is required (or set AWS_LAMBDA_FUNCTION_NAME)");
  }

  logship::v1::InvocationContext context;
  context.set_function_name(invocation.function_name());
  context.set_invoked_function_arn(invocation.invoked_function_arn());
  context.set_log_group_name(invocation.log_group_name());
  context.set_log_stream_name(invocation.log_stream_name());
  return context;
}

} // namespace logship::config
