#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "http_client.hpp"

namespace logship::transport {

/*
  libcurl easy-interface client. One handle is reused across requests
  so keep-alive connections survive between payloads of an invocation.
  Not thread safe.
*/
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds request_timeout);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&)            = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Post(const std::string& url, const HttpHeaders& headers, const std::string& body) override;

 private:
  struct Handle;

  std::unique_ptr<Handle>   handle_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds request_timeout_;
};

// RAII for curl_global_init / curl_global_cleanup; one per process.
class ScopeCurlInit {
 public:
  ScopeCurlInit();
  ~ScopeCurlInit();

  ScopeCurlInit(const ScopeCurlInit&)            = delete;
  ScopeCurlInit& operator=(const ScopeCurlInit&) = delete;
};

} // namespace logship::transport
