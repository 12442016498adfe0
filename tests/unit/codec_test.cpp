#include <cassert>
#include <iostream>
#include <random>
#include <string>

#include "internal/codec/base64.hpp"
#include "internal/codec/gzip.hpp"
#include "internal/codec/utf8.hpp"
#include "internal/util/errors.hpp"

namespace {

using logship::codec::Base64Decode;
using logship::codec::Base64Encode;
using logship::codec::GzipCompress;
using logship::codec::GzipDecompress;
using logship::codec::IsValidUtf8;

template <typename Fn>
bool ThrowsDecodeError(Fn&& fn) {
  try {
    fn();
  } catch (const logship::util::DecodeError&) {
    return true;
  }
  return false;
}

void TestBase64KnownVectors() {
  assert(Base64Decode("") == "");
  assert(Base64Decode("Zg==") == "f");
  assert(Base64Decode("Zm8=") == "fo");
  assert(Base64Decode("Zm9v") == "foo");
  assert(Base64Decode("aGVsbG8gd29ybGQ=") == "hello world");

  assert(Base64Encode("f") == "Zg==");
  assert(Base64Encode("fo") == "Zm8=");
  assert(Base64Encode("hello world") == "aGVsbG8gd29ybGQ=");
}

void TestBase64IgnoresWhitespace() {
  assert(Base64Decode("aGVs\nbG8g\r\nd29y bGQ=") == "hello world");
}

void TestBase64RejectsBadInput() {
  assert(ThrowsDecodeError([] { Base64Decode("abc"); }));
  assert(ThrowsDecodeError([] { Base64Decode("ab!d"); }));
  assert(ThrowsDecodeError([] { Base64Decode("a=bc"); }));
  assert(ThrowsDecodeError([] { Base64Decode("Zg==Zg=="); }));
}

void TestBase64BinaryRoundTrip() {
  std::string binary;
  for (int i = 0; i < 256; ++i) {
    binary.push_back(static_cast<char>(i));
  }
  assert(Base64Decode(Base64Encode(binary)) == binary);
}

void TestGzipRoundTripLargeInput() {
  std::mt19937 rng(7);
  std::string  text;
  for (int i = 0; i < 200000; ++i) {
    text.push_back(static_cast<char>('a' + rng() % 26));
  }

  const auto compressed = GzipCompress(text);
  assert(compressed.compare(0, 2, "\x1f\x8b") == 0);
  assert(compressed.size() < text.size());
  assert(GzipDecompress(compressed) == text);
}

void TestGzipEmptyInput() {
  const auto compressed = GzipCompress("");
  assert(!compressed.empty());
  assert(GzipDecompress(compressed).empty());
}

void TestGzipConcatenatedMembers() {
  const auto joined = GzipCompress("first line\n") + GzipCompress("second line\n");
  assert(GzipDecompress(joined) == "first line\nsecond line\n");
}

void TestGzipRejectsCorruptAndTruncatedInput() {
  auto compressed = GzipCompress("some log line that is long enough to matter");

  assert(ThrowsDecodeError([&] { GzipDecompress(compressed.substr(0, compressed.size() / 2)); }));
  assert(ThrowsDecodeError([] { GzipDecompress("not gzip at all"); }));
  assert(ThrowsDecodeError([] { GzipDecompress(""); }));

  compressed[compressed.size() - 6] ^= 0x5a; // break the CRC
  assert(ThrowsDecodeError([&] { GzipDecompress(compressed); }));
}

void TestUtf8Validation() {
  assert(IsValidUtf8(""));
  assert(IsValidUtf8("plain ascii"));
  assert(IsValidUtf8("caf\xc3\xa9"));
  assert(IsValidUtf8("\xe2\x98\x83"));
  assert(IsValidUtf8("\xf0\x9f\x93\x9c"));

  assert(!IsValidUtf8("\xc3"));             // truncated
  assert(!IsValidUtf8("\xc0\xaf"));         // overlong
  assert(!IsValidUtf8("\xed\xa0\x80"));     // surrogate
  assert(!IsValidUtf8("\xf4\x90\x80\x80")); // above U+10FFFF
  assert(!IsValidUtf8("\xff"));
  assert(!IsValidUtf8("\x1f\x8b\x08"));
}

} // namespace

int main() {
  TestBase64KnownVectors();
  TestBase64IgnoresWhitespace();
  TestBase64RejectsBadInput();
  TestBase64BinaryRoundTrip();
  TestGzipRoundTripLargeInput();
  TestGzipEmptyInput();
  TestGzipConcatenatedMembers();
  TestGzipRejectsCorruptAndTruncatedInput();
  TestUtf8Validation();

  std::cout << "logship_unit_codec: pass\n";
  return 0;
}
