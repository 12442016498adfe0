#pragma once

#include <cstdint>
#include <string>

namespace logship::transport {

enum class DeliveryStatus : std::uint8_t {
  kDelivered = 0,
  kRejected  = 1, // fatal 4xx, payload dropped
  kThrottled = 2, // 429, surfaced to the caller without retrying
  kExhausted = 3, // attempt budget consumed
};

enum class RejectReason : std::uint8_t {
  kNone              = 0,
  kMalformedPayload  = 1, // 400
  kInvalidLicenseKey = 2, // 403
  kInvalidEndpoint   = 3, // 404
  kBadRequest        = 4, // any other 4xx
};

struct DeliveryResult {
  DeliveryStatus status{DeliveryStatus::kDelivered};
  RejectReason   reason{RejectReason::kNone};
  long           http_status{0};
  std::uint32_t  attempts{0};
  std::string    detail;

  bool Delivered() const {
    return status == DeliveryStatus::kDelivered;
  }
};

const char* StatusName(DeliveryStatus status);
const char* ReasonName(RejectReason reason);

// Maps a 4xx status onto the reason it is rejected for.
RejectReason ReasonForStatus(long http_status);

// Operator facing hint, e.g. "Review your license key".
const char* ReasonHint(RejectReason reason);

} // namespace logship::transport
