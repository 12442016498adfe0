#pragma once

#include <string>
#include <string_view>

namespace logship::codec {

// Standard alphabet with '=' padding. Whitespace in the input is ignored.
std::string Base64Decode(std::string_view input);
std::string Base64Encode(std::string_view data);

} // namespace logship::codec
