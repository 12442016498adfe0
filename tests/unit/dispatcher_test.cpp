#include "internal/dispatch/dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <string>

#include "internal/codec/gzip.hpp"
#include "internal/envelope/envelope_codec.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_fakes.hpp"

namespace {

using logship::dispatch::Dispatcher;
using logship::testing::FakeHttpClient;
using logship::testing::RecordingSleeper;

struct Harness {
  std::shared_ptr<FakeHttpClient>   http;
  std::shared_ptr<RecordingSleeper> sleeper;
  std::unique_ptr<Dispatcher>       dispatcher;
};

Harness MakeHarness(std::vector<long> script, std::size_t max_payload_bytes = 1000 * 1024) {
  logship::config::DeliverySettings settings;
  settings.license_key = "license-123";
  settings.ingest_host = logship::config::kUsIngestHost;

  Harness harness;
  harness.http    = std::make_shared<FakeHttpClient>(std::move(script));
  harness.sleeper = std::make_shared<RecordingSleeper>();

  auto transport     = std::make_shared<logship::transport::IngestTransport>(settings, harness.http, harness.sleeper);
  harness.dispatcher = std::make_unique<Dispatcher>(transport, max_payload_bytes);
  return harness;
}

logship::v1::InvocationContext MakeContext() {
  logship::v1::InvocationContext context;
  context.set_function_name("log-forwarder");
  context.set_invoked_function_arn("arn:aws:lambda:us-east-1:123456789012:function:log-forwarder");
  context.set_log_group_name("/aws/lambda/log-forwarder");
  context.set_log_stream_name("2024/01/01/[$LATEST]abc");
  return context;
}

std::string HexNoise(std::mt19937& rng, std::size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(kHex[rng() % 16]);
  }
  return out;
}

std::string MakeBatch(std::size_t event_count, std::size_t message_length) {
  std::mt19937 rng(7);
  std::string  entry = R"({"messageType":"DATA_MESSAGE","logGroup":"/aws/ecs/api","logEvents":[)";
  for (std::size_t i = 0; i < event_count; ++i) {
    if (i > 0) {
      entry += ",";
    }
    entry += R"({"id":")" + std::to_string(i) + R"(","message":")" + HexNoise(rng, message_length) + R"("})";
  }
  entry += "]}";
  return entry;
}

void TestSmallRecordIsSentOnce() {
  auto       harness = MakeHarness({200});
  const auto report  = harness.dispatcher->Dispatch("plain text line", MakeContext());

  assert(report.payloads_delivered == 1);
  assert(report.payloads_rejected == 0);
  assert(harness.http->calls.size() == 1);
  assert(harness.http->calls[0].url == "https://cloud-collector.newrelic.com/aws/v1");

  const auto envelope =
      logship::envelope::ParseEnvelope(logship::codec::GzipDecompress(harness.http->calls[0].body));
  assert(envelope.entry() == "plain text line");
  assert(envelope.context().function_name() == "log-forwarder");
  assert(envelope.context().log_stream_name() == "2024/01/01/[$LATEST]abc");
}

void TestCategoryChoosesEndpoint() {
  auto harness = MakeHarness({200});
  harness.dispatcher->Dispatch(R"({"logGroup":"/aws/vpc/flow-logs","logEvents":[]})", MakeContext());
  harness.dispatcher->Dispatch(
      R"({"logGroup":"/aws/lambda/checkout","logEvents":[{"message":"[1,\"NR_LAMBDA_MONITORING\",\"payload\"]"}]})",
      MakeContext());
  harness.dispatcher->Dispatch(R"({"logGroup":"/aws/lambda/checkout","logEvents":[{"message":"START"}]})",
                               MakeContext());

  assert(harness.http->calls.size() == 3);
  assert(harness.http->calls[0].url == "https://cloud-collector.newrelic.com/aws/vpc/v1");
  assert(harness.http->calls[1].url == "https://cloud-collector.newrelic.com/aws/lambda/v1");
  assert(harness.http->calls[2].url == "https://cloud-collector.newrelic.com/aws/v1");
}

void TestRejectedPayloadDoesNotStopSiblings() {
  auto       harness = MakeHarness({400, 200}, 4 * 1024);
  const auto report  = harness.dispatcher->Dispatch(MakeBatch(64, 200), MakeContext());

  assert(harness.http->calls.size() >= 2);
  assert(report.payloads_rejected == 1);
  assert(report.payloads_delivered == harness.http->calls.size() - 1);
  assert(harness.sleeper->sleeps.empty());
}

void TestExhaustionAbortsRecord() {
  auto harness = MakeHarness({0}, 4 * 1024);

  bool threw = false;
  try {
    harness.dispatcher->Dispatch(MakeBatch(64, 200), MakeContext());
  } catch (const logship::util::RetriesExhausted&) {
    threw = true;
  }

  assert(threw);
  // Only the first payload was attempted.
  assert(harness.http->calls.size() == 3);
  assert(harness.sleeper->sleeps.size() == 2);
}

void TestThrottlingAbortsRecord() {
  auto harness = MakeHarness({429});

  bool threw = false;
  try {
    harness.dispatcher->Dispatch("line", MakeContext());
  } catch (const logship::util::Throttled&) {
    threw = true;
  }

  assert(threw);
  assert(harness.http->calls.size() == 1);
}

void TestInvalidTextIsDroppedBeforeSending() {
  auto       harness = MakeHarness({200});
  const auto report  = harness.dispatcher->Dispatch(std::string("bad \xff\xfe bytes"), MakeContext());

  assert(report.payloads_rejected == 1);
  assert(report.payloads_delivered == 0);
  assert(harness.http->calls.empty());
}

void TestOversizedPlainTextIsDropped() {
  std::mt19937 rng(3);
  auto         harness = MakeHarness({200}, 1024);
  const auto   report  = harness.dispatcher->Dispatch(HexNoise(rng, 20000), MakeContext());

  assert(report.payloads_rejected == 1);
  assert(report.payloads_delivered == 0);
  assert(harness.http->calls.empty());
}

void TestReportsAccumulate() {
  logship::dispatch::DispatchReport total;
  total += logship::dispatch::DispatchReport{2, 1};
  total += logship::dispatch::DispatchReport{3, 0};
  assert(total.payloads_delivered == 5);
  assert(total.payloads_rejected == 1);
}

} // namespace

int main() {
  TestSmallRecordIsSentOnce();
  TestCategoryChoosesEndpoint();
  TestRejectedPayloadDoesNotStopSiblings();
  TestExhaustionAbortsRecord();
  TestThrottlingAbortsRecord();
  TestInvalidTextIsDroppedBeforeSending();
  TestOversizedPlainTextIsDropped();
  TestReportsAccumulate();

  std::cout << "logship_unit_dispatcher: pass\n";
  return 0;
}
