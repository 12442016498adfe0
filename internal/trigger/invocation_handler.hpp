#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/trigger/event_json.hpp"
#include "internal/trigger/object_source.hpp"
#include "logship/v1/envelope.pb.h"

namespace logship::trigger {

struct InvocationSummary {
  EventKind                kind{EventKind::kUnsupported};
  std::size_t              records{0};
  std::size_t              records_failed{0};
  dispatch::DispatchReport payloads;
};

/*
  Entry point of one invocation.

  CloudWatch Logs events carry a single base64(gzip) block which is
  dispatched as one record. S3 notifications name an object whose body
  (gunzipped for *.gz keys) is dispatched line by line.

  A record that ends in util::RetriesExhausted or util::Throttled
  aborts the invocation unless continue_on_record_failure is set, in
  which case it is logged, counted and the next record proceeds.
*/
class InvocationHandler {
 public:
  InvocationHandler(std::shared_ptr<dispatch::Dispatcher> dispatcher, std::shared_ptr<ObjectSource> objects,
                    bool continue_on_record_failure);

  InvocationSummary Handle(const std::string& event_json, const logship::v1::InvocationContext& context);

 private:
  void HandleCloudWatch(const TriggerEvent& event, const logship::v1::InvocationContext& context,
                        InvocationSummary* summary);
  void HandleS3(const TriggerEvent& event, const logship::v1::InvocationContext& context, InvocationSummary* summary);

  void DispatchRecord(std::string record, const logship::v1::InvocationContext& context, InvocationSummary* summary);

  std::shared_ptr<dispatch::Dispatcher> dispatcher_;
  std::shared_ptr<ObjectSource>         objects_;
  bool                                  continue_on_record_failure_;
};

// Splits on "\n", "\r\n" and "\r"; empty lines are dropped.
std::vector<std::string> SplitLines(const std::string& text);

} // namespace logship::trigger
