#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "config/config.pb.h"
#include "internal/transport/retry_policy.hpp"
#include "logship/v1/envelope.pb.h"

namespace logship::config {

// Ingest service endpoints. Do not modify.
inline constexpr const char* kUsIngestHost         = "https://cloud-collector.newrelic.com";
inline constexpr const char* kEuIngestHost         = "https://cloud-collector.eu.newrelic.com";
inline constexpr const char* kIngestServiceVersion = "v1";

inline constexpr std::size_t kDefaultMaxPayloadBytes = 1000 * 1024;

enum class Region {
  kUs,
  kEu,
  kCustom,
};

/*
  Immutable view of everything the delivery path needs.

  Built once at startup from RuntimeConfig and handed to the transport
  and dispatcher by const reference; nothing below reads the
  environment or the YAML again.
*/
struct DeliverySettings {
  std::string license_key;
  Region      region{Region::kUs};
  std::string ingest_host;
  std::string service_version{kIngestServiceVersion};

  std::size_t max_payload_bytes{kDefaultMaxPayloadBytes};

  transport::RetryPolicy retry;

  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds request_timeout{30000};

  bool continue_on_record_failure{false};
};

// Throws util::ConfigError on missing or inconsistent values.
DeliverySettings ResolveDeliverySettings(const logship::runtime::config::RuntimeConfig& config);

/*
  Maps the region selector onto a host:
    "US" / "EU"            -> fixed hosts (case insensitive)
    "http(s)://..."        -> used verbatim, trailing '/' stripped
    ""                     -> inferred from the license key prefix when
                              infer_from_license_key is set, otherwise
                              a ConfigError
*/
std::string ResolveIngestHost(const std::string& region, const std::string& license_key, bool infer_from_license_key,
                              Region* resolved = nullptr);

logship::v1::InvocationContext ResolveInvocationContext(const logship::runtime::config::RuntimeConfig& config);

} // namespace logship::config
