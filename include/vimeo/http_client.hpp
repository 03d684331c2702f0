#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vimeo {

struct CaseInsensitiveLess {
  using is_transparent = void;

  bool operator()(std::string_view lhs, std::string_view rhs) const;
};

/**
 * Response headers. Keys compare case-insensitively and a header may appear
 * more than once.
 */
using HttpHeaders = std::multimap<std::string, std::string, CaseInsensitiveLess>;

/**
 * Returns the first value stored for `name`, or std::nullopt when absent.
 */
std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name);

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
  long status_code = 0;
  HttpHeaders headers;
  std::string body;
};

/**
 * Performs a single HTTP exchange. Implementations return non-2xx responses
 * normally and throw APIConnectionError (or APIConnectionTimeoutError) only
 * when no response was received at all.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace vimeo
