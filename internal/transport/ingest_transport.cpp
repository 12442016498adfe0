#include "ingest_transport.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace logship::transport {

using observability::IntField;
using observability::StringField;

namespace {

constexpr long kTooManyRequests = 429;

bool IsSuccess(long status) {
  return status >= 200 && status < 300;
}

bool IsClientError(long status) {
  return status >= 400 && status < 500;
}

} // namespace

IngestTransport::IngestTransport(config::DeliverySettings settings, std::shared_ptr<HttpClient> http,
                                 std::shared_ptr<Sleeper> sleeper)
    : settings_(std::move(settings)),
      http_(std::move(http)),
      sleeper_(std::move(sleeper)) {}

std::string IngestTransport::UrlFor(classify::EntryCategory category) const {
  return settings_.ingest_host + classify::CategoryPath(category) + "/" + settings_.service_version;
}

HttpHeaders IngestTransport::RequestHeaders() const {
  return {
      {"X-License-Key", settings_.license_key},
      {"Content-Encoding", "gzip"},
      {"Content-Type", "application/json"},
  };
}

DeliveryResult IngestTransport::Send(classify::EntryCategory category, const split::Payload& payload) {
  const auto& policy  = settings_.retry;
  const auto  url     = UrlFor(category);
  const auto  headers = RequestHeaders();

  DeliveryResult result;
  auto           backoff = policy.initial_backoff;

  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (attempt > 1) {
      LOGSHIP_LOG_INFO("Retrying", {IntField("attempt", attempt), IntField("backoff_ms", backoff.count())});
      sleeper_->Sleep(backoff);
      backoff = policy.NextBackoff(backoff);
    }

    result.attempts = attempt;

    try {
      const auto response = http_->Post(url, headers, payload.body);
      result.http_status  = response.status;

      if (IsSuccess(response.status)) {
        result.status = DeliveryStatus::kDelivered;
        result.detail.clear();
        LOGSHIP_LOG_INFO("Log entry sent",
                         {IntField("status", response.status), IntField("attempt", attempt),
                          IntField("bytes", static_cast<std::int64_t>(payload.body.size()))});
        return result;
      }

      if (response.status == kTooManyRequests) {
        result.status = DeliveryStatus::kThrottled;
        result.detail = "HTTP 429. Too many requests";
        LOGSHIP_LOG_WARN("Ingest service is throttling", {IntField("attempt", attempt), StringField("url", url)});
        return result;
      }

      if (IsClientError(response.status)) {
        result.status = DeliveryStatus::kRejected;
        result.reason = ReasonForStatus(response.status);
        result.detail = "HTTP " + std::to_string(response.status) + ". " + ReasonHint(result.reason);
        LOGSHIP_LOG_WARN("Ingest service rejected payload",
                         {IntField("status", response.status), StringField("reason", ReasonName(result.reason)),
                          StringField("url", url)});
        return result;
      }

      result.detail = "HTTP " + std::to_string(response.status);
      LOGSHIP_LOG_WARN("There was an error",
                       {IntField("attempt", attempt), IntField("status", response.status), StringField("url", url)});
    } catch (const util::NetworkError& e) {
      result.http_status = 0;
      result.detail      = e.what();
      LOGSHIP_LOG_WARN("There was an error", {IntField("attempt", attempt), StringField("reason", e.what())});
    }
  }

  result.status = DeliveryStatus::kExhausted;
  return result;
}

} // namespace logship::transport
