#pragma once

#include <memory>
#include <string>

#include "internal/classify/entry_classifier.hpp"
#include "internal/config/delivery_settings.hpp"
#include "internal/split/payload_splitter.hpp"
#include "internal/transport/delivery_result.hpp"
#include "internal/transport/http_client.hpp"
#include "internal/transport/sleeper.hpp"

namespace logship::transport {

/*
  POSTs compressed payloads to the ingest service.

  Per Send() call the transport runs a small state machine:

    Attempting(n, backoff)
      2xx               -> Delivered
      429               -> Throttled       (no further attempt)
      other 4xx         -> Rejected(reason) (no further attempt)
      5xx / network err -> sleep(backoff), Attempting(n + 1, backoff * multiplier)
                           or Exhausted once n == max_attempts

  The result is returned as a tagged DeliveryResult; nothing is thrown
  for HTTP outcomes.
*/
class IngestTransport {
 public:
  IngestTransport(config::DeliverySettings settings, std::shared_ptr<HttpClient> http, std::shared_ptr<Sleeper> sleeper);

  DeliveryResult Send(classify::EntryCategory category, const split::Payload& payload);

  // {host}{category path}/{version}
  std::string UrlFor(classify::EntryCategory category) const;

 private:
  HttpHeaders RequestHeaders() const;

  config::DeliverySettings    settings_;
  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<Sleeper>    sleeper_;
};

} // namespace logship::transport
