#include "payload_splitter.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/envelope/envelope_codec.hpp"
#include "internal/util/errors.hpp"

namespace logship::split {
namespace {

constexpr const char* kLogEventsField = "logEvents";
constexpr const char* kLogEventsKey   = "\"logEvents\"";

[[noreturn]] void Malformed(const std::string& what) {
  throw util::UnsplittableEntry("oversized entry " + what);
}

// Full JSON check; the scanner below only walks structure.
void ValidateEntry(const std::string& entry) {
  google::protobuf::Struct parsed;
  auto                     status = google::protobuf::util::JsonStringToMessage(entry, &parsed);
  if (!status.ok()) {
    Malformed("is not a JSON object: " + std::string(status.message()));
  }

  const auto it = parsed.fields().find(kLogEventsField);
  if (it == parsed.fields().end() || !it->second.has_list_value()) {
    Malformed("has no logEvents list");
  }
}

bool IsWhitespace(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

std::size_t SkipWhitespace(const std::string& text, std::size_t pos) {
  while (pos < text.size() && IsWhitespace(text[pos])) {
    ++pos;
  }
  return pos;
}

// pos is at the opening quote; returns the offset past the closing one.
std::size_t SkipString(const std::string& text, std::size_t pos) {
  for (++pos; pos < text.size(); ++pos) {
    if (text[pos] == '\\') {
      ++pos;
    } else if (text[pos] == '"') {
      return pos + 1;
    }
  }
  Malformed("has an unterminated string");
}

std::size_t SkipValue(const std::string& text, std::size_t pos) {
  if (pos >= text.size()) {
    Malformed("ends inside a value");
  }

  const char first = text[pos];
  if (first == '"') {
    return SkipString(text, pos);
  }

  if (first == '{' || first == '[') {
    int depth = 0;
    while (pos < text.size()) {
      const char ch = text[pos];
      if (ch == '"') {
        pos = SkipString(text, pos);
        continue;
      }
      if (ch == '{' || ch == '[') {
        ++depth;
      } else if ((ch == '}' || ch == ']') && --depth == 0) {
        return pos + 1;
      }
      ++pos;
    }
    Malformed("has unbalanced brackets");
  }

  // number, true, false, null
  while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' && !IsWhitespace(text[pos])) {
    ++pos;
  }
  return pos;
}

} // namespace

PayloadSequence::PayloadSequence(logship::v1::LogEnvelope envelope, std::size_t max_payload_bytes)
    : max_payload_bytes_(max_payload_bytes) {
  Pending initial;
  initial.envelope = std::move(envelope);
  stack_.push_back(std::move(initial));
}

std::optional<Payload> PayloadSequence::Next() {
  while (!stack_.empty()) {
    Pending item = std::move(stack_.back());
    stack_.pop_back();

    auto body = envelope::EncodeEnvelope(item.envelope);
    if (body.size() < max_payload_bytes_) {
      const std::size_t events = item.layout ? item.last_event - item.first_event : 0;
      return Payload{std::move(body), events};
    }

    Split(std::move(item), body.size());
  }
  return std::nullopt;
}

std::shared_ptr<const PayloadSequence::EventLayout> PayloadSequence::Locate(std::string entry) {
  auto layout  = std::make_shared<EventLayout>();
  layout->text = std::move(entry);

  const auto& text  = layout->text;
  bool        found = false;

  std::size_t pos = SkipWhitespace(text, 0);
  if (pos >= text.size() || text[pos] != '{') {
    Malformed("is not a JSON object");
  }
  pos = SkipWhitespace(text, pos + 1);

  while (pos < text.size() && text[pos] != '}') {
    if (text[pos] != '"') {
      Malformed("has a malformed member name");
    }
    const std::size_t key_begin = pos;
    pos                         = SkipString(text, pos);
    const bool is_events        = text.compare(key_begin, pos - key_begin, kLogEventsKey) == 0;

    pos = SkipWhitespace(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      Malformed("has a member without a value");
    }
    pos = SkipWhitespace(text, pos + 1);

    const std::size_t value_begin = pos;
    pos                           = SkipValue(text, pos);

    if (is_events) {
      if (text[value_begin] != '[') {
        Malformed("has no logEvents list");
      }
      // a repeated key replaces the earlier list
      found              = true;
      layout->list_begin = value_begin + 1;
      layout->list_end   = pos - 1;
      layout->events.clear();

      std::size_t cursor = SkipWhitespace(text, layout->list_begin);
      while (cursor < layout->list_end) {
        const std::size_t end = SkipValue(text, cursor);
        layout->events.emplace_back(cursor, end);

        cursor = SkipWhitespace(text, end);
        if (cursor < layout->list_end && text[cursor] == ',') {
          cursor = SkipWhitespace(text, cursor + 1);
        } else if (cursor != layout->list_end) {
          Malformed("has a malformed logEvents list");
        }
      }
    }

    pos = SkipWhitespace(text, pos);
    if (pos < text.size() && text[pos] == ',') {
      pos = SkipWhitespace(text, pos + 1);
    }
  }

  if (!found) {
    Malformed("has no logEvents list");
  }
  return layout;
}

std::string PayloadSequence::Slice(const EventLayout& layout, std::size_t first, std::size_t last) {
  const auto& text = layout.text;

  std::size_t size = layout.list_begin + (text.size() - layout.list_end);
  for (std::size_t i = first; i < last; ++i) {
    size += layout.events[i].second - layout.events[i].first + 1;
  }

  std::string entry;
  entry.reserve(size);
  entry.append(text, 0, layout.list_begin);
  for (std::size_t i = first; i < last; ++i) {
    if (i > first) {
      entry.push_back(',');
    }
    const auto& [begin, end] = layout.events[i];
    entry.append(text, begin, end - begin);
  }
  entry.append(text, layout.list_end, std::string::npos);
  return entry;
}

void PayloadSequence::Split(Pending&& oversized, std::size_t encoded_size) {
  try {
    if (!oversized.layout) {
      ValidateEntry(oversized.envelope.entry());
      oversized.layout      = Locate(std::move(*oversized.envelope.mutable_entry()));
      oversized.first_event = 0;
      oversized.last_event  = oversized.layout->events.size();
    }

    const std::size_t count = oversized.last_event - oversized.first_event;
    if (count <= 1) {
      throw util::PayloadTooLarge("a single log event encodes to " + std::to_string(encoded_size) +
                                  " bytes, limit is " + std::to_string(max_payload_bytes_));
    }

    const std::size_t middle = oversized.first_event + count / 2;

    auto make_half = [&](std::size_t first, std::size_t last) {
      Pending part;
      *part.envelope.mutable_context() = oversized.envelope.context();
      part.envelope.set_entry(Slice(*oversized.layout, first, last));
      part.layout      = oversized.layout;
      part.first_event = first;
      part.last_event  = last;
      return part;
    };

    // right first so the left half is popped next
    stack_.push_back(make_half(middle, oversized.last_event));
    stack_.push_back(make_half(oversized.first_event, middle));
  } catch (...) {
    stack_.clear();
    throw;
  }
}

PayloadSequence ToPayloads(logship::v1::LogEnvelope envelope, std::size_t max_payload_bytes) {
  return PayloadSequence(std::move(envelope), max_payload_bytes);
}

} // namespace logship::split
