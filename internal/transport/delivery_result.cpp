#include "delivery_result.hpp"

namespace logship::transport {

const char* StatusName(DeliveryStatus status) {
  switch (status) {
    case DeliveryStatus::kDelivered:
      return "delivered";
    case DeliveryStatus::kRejected:
      return "rejected";
    case DeliveryStatus::kThrottled:
      return "throttled";
    case DeliveryStatus::kExhausted:
      return "exhausted";
  }
  return "unknown";
}

const char* ReasonName(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kMalformedPayload:
      return "malformed_payload";
    case RejectReason::kInvalidLicenseKey:
      return "invalid_license_key";
    case RejectReason::kInvalidEndpoint:
      return "invalid_endpoint";
    case RejectReason::kBadRequest:
      return "bad_request";
  }
  return "unknown";
}

RejectReason ReasonForStatus(long http_status) {
  switch (http_status) {
    case 400:
      return RejectReason::kMalformedPayload;
    case 403:
      return RejectReason::kInvalidLicenseKey;
    case 404:
      return RejectReason::kInvalidEndpoint;
    default:
      return RejectReason::kBadRequest;
  }
}

const char* ReasonHint(RejectReason reason) {
  switch (reason) {
    case RejectReason::kMalformedPayload:
      return "Unexpected payload";
    case RejectReason::kInvalidLicenseKey:
      return "Review your license key";
    case RejectReason::kInvalidEndpoint:
      return "Review the region endpoint";
    case RejectReason::kBadRequest:
      return "Bad request";
    case RejectReason::kNone:
      break;
  }
  return "";
}

} // namespace logship::transport
