#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vimeo/error.hpp"
#include "vimeo/http_client.hpp"
#include "vimeo/logging.hpp"
#include "vimeo/uploads.hpp"
#include "vimeo/utils/qs.hpp"
#include "vimeo/videos.hpp"

namespace vimeo {

inline constexpr const char* kDefaultBaseUrl = "https://api.vimeo.com";
inline constexpr const char* kDefaultApiVersion = "3.4";

struct RequestOptions {
  // A std::nullopt value removes a header the client would otherwise send.
  std::map<std::string, std::optional<std::string>> headers;
  utils::qs::QueryParams query_params;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::size_t> max_retries;
};

struct ClientOptions {
  std::string access_token;
  std::string base_url = kDefaultBaseUrl;
  std::string api_version = kDefaultApiVersion;
  std::chrono::milliseconds timeout{60000};
  std::size_t max_retries = 2;
  std::map<std::string, std::string> default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/**
 * Outcome of one remote call that never throws: `response` holds whatever
 * the server returned (empty when nothing arrived) and `error` describes the
 * failure, if any.
 */
struct ExchangeResult {
  HttpResponse response;
  std::optional<RequestError> error;

  bool ok() const { return !error.has_value(); }
};

class VimeoClient {
public:
  /**
   * Missing options fall back to VIMEO_ACCESS_TOKEN, VIMEO_BASE_URL,
   * VIMEO_TIMEOUT_MS and VIMEO_LOG. Throws VimeoError when no access token is
   * available.
   */
  explicit VimeoClient(ClientOptions options,
                       std::unique_ptr<HttpClient> http_client = nullptr);

  const ClientOptions& options() const { return options_; }

  VideosResource& videos() { return videos_; }
  const VideosResource& videos() const { return videos_; }

  UploadsResource& uploads() { return uploads_; }
  const UploadsResource& uploads() const { return uploads_; }

  /**
   * Sends a request to an API path ("/me/videos") or an absolute URL and
   * returns the outcome as data. The bearer token is attached only when the
   * target lies under the configured base URL.
   */
  ExchangeResult exchange(const std::string& method,
                          const std::string& target,
                          const std::string& body,
                          const RequestOptions& options = {}) const;

  /** Like exchange, but throws the matching exception on failure. */
  HttpResponse request(const std::string& method,
                       const std::string& target,
                       const std::string& body,
                       const RequestOptions& options = {}) const;

  std::string resolve_url(const std::string& target) const;

private:
  friend class VideosResource;
  friend class UploadsResource;

  bool targets_api(const std::string& url) const;

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  VideosResource videos_;
  UploadsResource uploads_;
};

}  // namespace vimeo
