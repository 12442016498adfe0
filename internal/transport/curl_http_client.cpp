#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

#ifndef LOGSHIP_VERSION
#define LOGSHIP_VERSION "dev"
#endif

namespace logship::transport {
namespace {

// Response bodies are only kept for log messages.
constexpr std::size_t kMaxResponseBody = 4096;

std::size_t WriteFunction(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto&             body  = *static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  if (body.size() < kMaxResponseBody) {
    body.append(ptr, std::min(total, kMaxResponseBody - body.size()));
  }
  return total;
}

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

} // namespace

struct CurlHttpClient::Handle {
  CURL* easy{nullptr};

  Handle() : easy(curl_easy_init()) {
    if (easy == nullptr) {
      throw std::runtime_error("curl_easy_init() failed");
    }
  }

  ~Handle() {
    curl_easy_cleanup(easy);
  }
};

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds request_timeout)
    : handle_(std::make_unique<Handle>()),
      connect_timeout_(connect_timeout),
      request_timeout_(request_timeout) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::Post(const std::string& url, const HttpHeaders& headers, const std::string& body) {
  CURL* easy = handle_->easy;
  curl_easy_reset(easy);

  SlistPtr header_list;
  auto     append_header = [&header_list](const std::string& line) {
    curl_slist* head = curl_slist_append(header_list.get(), line.c_str());
    if (head == nullptr) {
      throw std::runtime_error("curl_slist_append() failed");
    }
    header_list.release();
    header_list.reset(head);
  };

  for (const auto& [name, value] : headers) {
    append_header(name + ": " + value);
  }
  // suppress libcurl's "Expect: 100-continue" on large bodies
  append_header("Expect:");

  HttpResponse response;
  char         error_buffer[CURL_ERROR_SIZE];
  error_buffer[0] = 0;

  curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
  curl_easy_setopt(easy, CURLOPT_POST, 1L);
  curl_easy_setopt(easy, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(easy, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(easy, CURLOPT_USERAGENT, "logship/" LOGSHIP_VERSION);
  curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, WriteFunction);
  curl_easy_setopt(easy, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
  curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_.count()));

  const CURLcode result = curl_easy_perform(easy);
  curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, static_cast<char*>(nullptr));
  if (result != CURLE_OK) {
    const char* msg = error_buffer[0] != 0 ? error_buffer : curl_easy_strerror(result);
    throw util::NetworkError(std::string("CURL failed: ") + msg);
  }

  curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

ScopeCurlInit::ScopeCurlInit() {
  const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (code != CURLE_OK) {
    throw std::runtime_error(std::string("CURL initialization failed: ") + curl_easy_strerror(code));
  }
}

ScopeCurlInit::~ScopeCurlInit() {
  curl_global_cleanup();
}

} // namespace logship::transport
