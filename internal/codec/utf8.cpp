#include "utf8.hpp"

#include <cstdint>

namespace logship::codec {

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<std::uint8_t>(text[i]);

    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t   length    = 0;
    std::uint32_t codepoint = 0;
    if ((lead & 0xE0) == 0xC0) {
      length    = 2;
      codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length    = 3;
      codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length    = 4;
      codepoint = lead & 0x07;
    } else {
      return false;
    }

    if (i + length > text.size()) {
      return false;
    }

    for (std::size_t k = 1; k < length; ++k) {
      const auto next = static_cast<std::uint8_t>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (next & 0x3F);
    }

    if ((length == 2 && codepoint < 0x80) || (length == 3 && codepoint < 0x800) ||
        (length == 4 && codepoint < 0x10000)) {
      return false;
    }
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      return false;
    }

    i += length;
  }
  return true;
}

} // namespace logship::codec
