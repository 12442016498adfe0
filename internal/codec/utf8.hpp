#pragma once

#include <string_view>

namespace logship::codec {

// Strict RFC 3629 check: no overlongs, no surrogates, nothing above U+10FFFF.
bool IsValidUtf8(std::string_view text);

} // namespace logship::codec
