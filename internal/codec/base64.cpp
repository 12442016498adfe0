#include "base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

#include "internal/util/errors.hpp"

namespace logship::codec {
namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;

const std::array<std::uint8_t, 256>& ReverseTable() {
  static const std::array<std::uint8_t, 256> table = [] {
    std::array<std::uint8_t, 256> map{};
    map.fill(kInvalid);
    for (std::size_t i = 0; i < 64; ++i) {
      map[static_cast<std::uint8_t>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return map;
  }();
  return table;
}

} // namespace

std::string Base64Decode(std::string_view input) {
  std::string filtered;
  filtered.reserve(input.size());
  for (char ch : input) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      filtered.push_back(ch);
    }
  }

  if (filtered.size() % 4 != 0) {
    throw util::DecodeError("base64 input length is not a multiple of 4");
  }

  std::size_t padding = 0;
  if (!filtered.empty() && filtered.back() == '=') {
    ++padding;
    if (filtered[filtered.size() - 2] == '=') {
      ++padding;
    }
  }

  const auto& reverse = ReverseTable();

  std::string decoded;
  decoded.reserve((filtered.size() / 4) * 3);

  for (std::size_t i = 0; i < filtered.size(); i += 4) {
    const bool last = i + 4 == filtered.size();

    std::uint32_t triple = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      const char ch = filtered[i + j];
      if (ch == '=' && last && j >= 4 - padding) {
        triple <<= 6;
        continue;
      }
      const auto value = reverse[static_cast<std::uint8_t>(ch)];
      if (value == kInvalid) {
        throw util::DecodeError("invalid base64 character");
      }
      triple = (triple << 6) | value;
    }

    decoded.push_back(static_cast<char>((triple >> 16) & 0xFF));
    if (!last || padding < 2) {
      decoded.push_back(static_cast<char>((triple >> 8) & 0xFF));
    }
    if (!last || padding < 1) {
      decoded.push_back(static_cast<char>(triple & 0xFF));
    }
  }

  return decoded;
}

std::string Base64Encode(std::string_view data) {
  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  std::size_t index = 0;
  while (index + 3 <= data.size()) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index])) << 16) |
                                 (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index + 1])) << 8) |
                                 static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index + 2]));
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    encoded.push_back(kAlphabet[triple & 0x3F]);
    index += 3;
  }

  const std::size_t remaining = data.size() - index;
  if (remaining == 1) {
    const std::uint32_t triple = static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index])) << 16;
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.append("==");
  } else if (remaining == 2) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index])) << 16) |
                                 (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[index + 1])) << 8);
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    encoded.push_back('=');
  }

  return encoded;
}

} // namespace logship::codec
