#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/transport/ingest_transport.hpp"
#include "logship/v1/envelope.pb.h"

namespace logship::dispatch {

struct DispatchReport {
  std::size_t payloads_delivered{0};
  std::size_t payloads_rejected{0};

  DispatchReport& operator+=(const DispatchReport& other) {
    payloads_delivered += other.payloads_delivered;
    payloads_rejected += other.payloads_rejected;
    return *this;
  }
};

/*
  Runs one raw record through build -> classify -> split -> send.

  Failure handling per payload:
    Rejected                          logged, counted, siblings continue
    UnsplittableEntry/PayloadTooLarge logged, counted, rest of record dropped
    InvalidEntry                      logged, counted, record dropped
    Throttled                         throws util::Throttled
    Exhausted                         throws util::RetriesExhausted
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<transport::IngestTransport> transport, std::size_t max_payload_bytes);

  DispatchReport Dispatch(std::string raw_record, const logship::v1::InvocationContext& context);

 private:
  std::shared_ptr<transport::IngestTransport> transport_;
  std::size_t                                 max_payload_bytes_;
};

} // namespace logship::dispatch
