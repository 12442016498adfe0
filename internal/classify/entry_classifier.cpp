#include "entry_classifier.hpp"

namespace logship::classify {
namespace {

constexpr std::string_view kVpcFlowLogGroup = R"("logGroup":"/aws/vpc/flow-logs")";
constexpr std::string_view kLambdaLogGroup  = R"("logGroup":"/aws/lambda/)";

// The agent tag appears inside the JSON-encoded message, hence the escaped quotes.
constexpr std::string_view kLambdaMonitoringTag = R"(,\"NR_LAMBDA_MONITORING\",)";

bool Contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

} // namespace

EntryCategory Classify(std::string_view entry) noexcept {
  if (Contains(entry, kVpcFlowLogGroup)) {
    return EntryCategory::kVpc;
  }
  if (Contains(entry, kLambdaLogGroup) && Contains(entry, kLambdaMonitoringTag)) {
    return EntryCategory::kLambda;
  }
  return EntryCategory::kOther;
}

const char* CategoryName(EntryCategory category) noexcept {
  switch (category) {
    case EntryCategory::kVpc:
      return "vpc";
    case EntryCategory::kLambda:
      return "lambda";
    case EntryCategory::kOther:
      break;
  }
  return "other";
}

const char* CategoryPath(EntryCategory category) noexcept {
  switch (category) {
    case EntryCategory::kVpc:
      return "/aws/vpc";
    case EntryCategory::kLambda:
      return "/aws/lambda";
    case EntryCategory::kOther:
      break;
  }
  return "/aws";
}

} // namespace logship::classify
