#include "gzip.hpp"

#include <zlib.h>

#include <array>
#include <cstring>

#include "internal/util/errors.hpp"

namespace logship::codec {
namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr int kAutoWindowBits = 15 + 32;

constexpr std::size_t kChunkSize = 64 * 1024;

std::string ZlibMessage(const z_stream& stream, int code) {
  if (stream.msg != nullptr) {
    return stream.msg;
  }
  return "zlib error " + std::to_string(code);
}

} // namespace

std::string GzipCompress(std::string_view data, int level) {
  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));

  int rc = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error("deflateInit2 failed: " + ZlibMessage(stream, rc));
  }

  std::string out;
  out.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

  stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in  = static_cast<uInt>(data.size());
  stream.next_out  = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  rc = deflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  deflateEnd(&stream);

  if (rc != Z_STREAM_END) {
    throw std::runtime_error("deflate failed: " + ZlibMessage(stream, rc));
  }

  out.resize(produced);
  return out;
}

std::string GzipDecompress(std::string_view data) {
  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));

  int rc = inflateInit2(&stream, kAutoWindowBits);
  if (rc != Z_OK) {
    throw util::DecodeError("inflateInit2 failed: " + ZlibMessage(stream, rc));
  }

  stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string                  out;
  std::array<char, kChunkSize> chunk;
  bool                         finished = false;

  while (true) {
    stream.next_out  = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = static_cast<uInt>(chunk.size());

    rc = inflate(&stream, Z_NO_FLUSH);
    out.append(chunk.data(), chunk.size() - stream.avail_out);

    if (rc == Z_STREAM_END) {
      if (stream.avail_in == 0) {
        finished = true;
        break;
      }
      // next gzip member
      rc = inflateReset(&stream);
      if (rc != Z_OK) {
        break;
      }
      continue;
    }

    if (rc != Z_OK) {
      break;
    }

    if (stream.avail_in == 0 && stream.avail_out != 0) {
      // input consumed without reaching the end of the stream
      rc = Z_DATA_ERROR;
      break;
    }
  }

  const std::string message = ZlibMessage(stream, rc);
  inflateEnd(&stream);

  if (!finished) {
    throw util::DecodeError("gzip decode failed: " + message);
  }
  return out;
}

} // namespace logship::codec
