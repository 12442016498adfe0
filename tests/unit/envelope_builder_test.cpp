#include "internal/envelope/envelope_builder.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/codec/gzip.hpp"
#include "internal/envelope/envelope_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using logship::envelope::BuildEnvelope;
using logship::envelope::EncodeEnvelope;
using logship::envelope::ParseEnvelope;
using logship::envelope::SerializeEnvelope;

logship::v1::InvocationContext MakeContext() {
  logship::v1::InvocationContext context;
  context.set_function_name("log-forwarder");
  context.set_invoked_function_arn("arn:aws:lambda:us-east-1:123456789012:function:log-forwarder");
  context.set_log_group_name("/aws/lambda/log-forwarder");
  context.set_log_stream_name("2024/01/01/[$LATEST]abcdef");
  return context;
}

void TestBuildCopiesContextAndEntry() {
  const auto context  = MakeContext();
  const auto envelope = BuildEnvelope("hello world", context);

  assert(envelope.entry() == "hello world");
  assert(envelope.context().function_name() == "log-forwarder");
  assert(envelope.context().invoked_function_arn() == context.invoked_function_arn());
  assert(envelope.context().log_group_name() == "/aws/lambda/log-forwarder");
  assert(envelope.context().log_stream_name() == "2024/01/01/[$LATEST]abcdef");
}

void TestBuildIsDeterministic() {
  const auto context = MakeContext();
  assert(SerializeEnvelope(BuildEnvelope("same", context)) == SerializeEnvelope(BuildEnvelope("same", context)));
}

void TestBuildAcceptsMultibyteText() {
  const auto envelope = BuildEnvelope("caf\xc3\xa9 \xe2\x98\x83 \xf0\x9f\x93\x9c", MakeContext());
  assert(envelope.entry().size() == 14);
}

void TestBuildRejectsInvalidUtf8() {
  bool threw = false;
  try {
    BuildEnvelope(std::string("\x1f\x8b\x08\x00\xff", 5), MakeContext());
  } catch (const logship::util::InvalidEntry&) {
    threw = true;
  }
  assert(threw);
}

void TestSerializedWireForm() {
  logship::v1::InvocationContext context;
  context.set_function_name("fn");
  context.set_invoked_function_arn("arn");
  context.set_log_group_name("lg");
  context.set_log_stream_name("ls");

  const auto json = SerializeEnvelope(BuildEnvelope("line \"quoted\"", context));
  assert(json == R"({"context":{"function_name":"fn","invoked_function_arn":"arn","log_group_name":"lg",)"
                 R"("log_stream_name":"ls"},"entry":"line \"quoted\""})");
}

void TestSerializedWireFormKeepsEmptyContextFields() {
  logship::v1::InvocationContext context;
  context.set_function_name("fn");

  const auto json = SerializeEnvelope(BuildEnvelope("x", context));
  assert(json.find(R"("invoked_function_arn":"")") != std::string::npos);
  assert(json.find(R"("log_group_name":"")") != std::string::npos);
  assert(json.find(R"("log_stream_name":"")") != std::string::npos);
}

void TestEncodedFormIsGzipOfSerializedForm() {
  const auto envelope = BuildEnvelope("payload body", MakeContext());
  const auto encoded  = EncodeEnvelope(envelope);

  assert(encoded.compare(0, 2, "\x1f\x8b") == 0);
  const auto decoded = logship::codec::GzipDecompress(encoded);
  assert(decoded == SerializeEnvelope(envelope));

  const auto parsed = ParseEnvelope(decoded);
  assert(parsed.entry() == "payload body");
  assert(parsed.context().function_name() == "log-forwarder");
}

} // namespace

int main() {
  TestBuildCopiesContextAndEntry();
  TestBuildIsDeterministic();
  TestBuildAcceptsMultibyteText();
  TestBuildRejectsInvalidUtf8();
  TestSerializedWireForm();
  TestSerializedWireFormKeepsEmptyContextFields();
  TestEncodedFormIsGzipOfSerializedForm();

  std::cout << "logship_unit_envelope_builder: pass\n";
  return 0;
}
