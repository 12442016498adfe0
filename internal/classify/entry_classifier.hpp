#pragma once

#include <cstdint>
#include <string_view>

namespace logship::classify {

/*
  Routing key for the ingest service. Derived from the entry text on
  every dispatch, never stored.
*/
enum class EntryCategory : std::uint8_t {
  kVpc    = 0,
  kLambda = 1,
  kOther  = 2,
};

EntryCategory Classify(std::string_view entry) noexcept;

const char* CategoryName(EntryCategory category) noexcept;

// Path segment under the ingest host, without the version suffix.
const char* CategoryPath(EntryCategory category) noexcept;

} // namespace logship::classify
