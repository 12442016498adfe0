#pragma once

#include <string>
#include <utility>
#include <vector>

namespace logship::transport {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long        status{0};
  std::string body;
};

/*
  Blocking HTTP client seam.

  Post() returns whatever status the server answered with; it throws
  util::NetworkError only when no HTTP response was obtained
  (DNS, connect, TLS, timeout).
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Post(const std::string& url, const HttpHeaders& headers, const std::string& body) = 0;
};

} // namespace logship::transport
