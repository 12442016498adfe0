#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logship/v1/envelope.pb.h"

namespace logship::split {

/*
  Compressed, size-bounded request body.

  event_count is the number of logEvents carried when the entry had to
  be split, 0 when the envelope went out as built.
*/
struct Payload {
  std::string body;
  std::size_t event_count{0};
};

/*
  Lazily turns one envelope into request bodies that each compress to
  strictly less than max_payload_bytes.

  An oversized envelope is split by halving the logEvents list of its
  JSON entry (left half gets n / 2 events), recursively, via an
  explicit stack. Payloads come out in event order; the sequence is
  consumed once.

  Halves are cut from the entry text itself: every event and every
  other entry field keeps its exact original bytes, so number
  precision and key order survive a split.

  Next() throws:
    util::UnsplittableEntry - oversized entry is not JSON with logEvents
    util::PayloadTooLarge   - a single event alone exceeds the limit
  after which the sequence is exhausted.
*/
class PayloadSequence {
 public:
  PayloadSequence(logship::v1::LogEnvelope envelope, std::size_t max_payload_bytes);

  std::optional<Payload> Next();

 private:
  // Byte offsets of the logEvents array inside the entry text.
  struct EventLayout {
    std::string                                      text;
    std::size_t                                      list_begin{0}; // first byte after '['
    std::size_t                                      list_end{0};   // the closing ']'
    std::vector<std::pair<std::size_t, std::size_t>> events;        // [begin, end) per element
  };

  struct Pending {
    logship::v1::LogEnvelope           envelope;
    std::shared_ptr<const EventLayout> layout;
    std::size_t                        first_event{0};
    std::size_t                        last_event{0};
  };

  static std::shared_ptr<const EventLayout> Locate(std::string entry);
  static std::string                        Slice(const EventLayout& layout, std::size_t first, std::size_t last);

  void Split(Pending&& oversized, std::size_t encoded_size);

  std::vector<Pending> stack_;
  std::size_t          max_payload_bytes_;
};

PayloadSequence ToPayloads(logship::v1::LogEnvelope envelope, std::size_t max_payload_bytes);

} // namespace logship::split
