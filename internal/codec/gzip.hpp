#pragma once

#include <string>
#include <string_view>

namespace logship::codec {

// Level used for everything placed on the wire.
constexpr int kWireCompressionLevel = 9;

std::string GzipCompress(std::string_view data, int level = kWireCompressionLevel);

/*
  Inflates a gzip (or zlib) stream. Concatenated gzip members are
  inflated back to back, as CloudWatch and S3 both produce them.
  Throws util::DecodeError on corrupt or truncated input.
*/
std::string GzipDecompress(std::string_view data);

} // namespace logship::codec
