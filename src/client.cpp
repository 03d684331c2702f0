#include "vimeo/client.hpp"

#include "vimeo/error.hpp"
#include "vimeo/http_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <locale>
#include <set>
#include <sstream>
#include <string_view>
#include <utility>

#include "vimeo/logging.hpp"
#include "vimeo/utils/env.hpp"
#include "vimeo/utils/platform.hpp"
#include "vimeo/utils/time.hpp"
#include "vimeo/utils/values.hpp"

namespace vimeo {
namespace {

using json = nlohmann::json;

constexpr std::chrono::milliseconds kMaxRetryAfter = std::chrono::milliseconds(60'000);
constexpr std::chrono::milliseconds kDefaultTimeout = std::chrono::milliseconds(60'000);

std::string to_lower(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::optional<std::chrono::milliseconds> parse_retry_after_seconds(const std::string& value) {
  char* end = nullptr;
  double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() && !std::isnan(parsed)) {
    if (parsed < 0) {
      return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<long>(parsed * 1000.0));
  }
  return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_retry_after_http_date(const std::string& value) {
  std::tm tm{};
  std::istringstream stream(value);
  stream.imbue(std::locale::classic());
  stream >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
  if (stream.fail()) {
    return std::nullopt;
  }
#if defined(_WIN32)
  std::time_t utc_time = _mkgmtime(&tm);
#else
  std::time_t utc_time = timegm(&tm);
#endif
  if (utc_time == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  auto delta = std::difftime(utc_time, now_time);
  if (delta <= 0) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::milliseconds(static_cast<long>(delta * 1000.0));
}

std::optional<std::chrono::milliseconds> parse_retry_after(const HttpHeaders& headers) {
  if (auto retry_after_ms = find_header(headers, "retry-after-ms")) {
    char* end = nullptr;
    double parsed = std::strtod(retry_after_ms->c_str(), &end);
    if (end != retry_after_ms->c_str() && !std::isnan(parsed)) {
      return std::chrono::milliseconds(static_cast<long>(std::max(parsed, 0.0)));
    }
  }
  auto retry_after = find_header(headers, "Retry-After");
  if (!retry_after) {
    return std::nullopt;
  }
  if (auto parsed_seconds = parse_retry_after_seconds(*retry_after)) {
    return parsed_seconds;
  }
  return parse_retry_after_http_date(*retry_after);
}

bool should_retry_status(long status) {
  if (status == 408 || status == 409 || status == 429) {
    return true;
  }
  return status >= 500;
}

std::chrono::milliseconds compute_retry_delay(const HttpResponse* response,
                                              std::size_t retries_remaining,
                                              std::size_t max_retries) {
  if (response) {
    if (auto header_delay = parse_retry_after(response->headers)) {
      if (*header_delay < kMaxRetryAfter) {
        return *header_delay;
      }
    }
  }
  return std::clamp(utils::calculate_default_retry_delay(retries_remaining, max_retries),
                    std::chrono::milliseconds(0), kMaxRetryAfter);
}

void apply_optional_entries(std::map<std::string, std::string>& target,
                            const std::map<std::string, std::optional<std::string>>& overrides) {
  for (const auto& [key, value] : overrides) {
    if (value.has_value()) {
      target[key] = *value;
    } else {
      target.erase(key);
    }
  }
}

std::string build_url(const std::string& base_url, const std::string& path) {
  if (path.empty()) {
    return base_url;
  }
  if (utils::is_absolute_url(path)) {
    return path;
  }
  std::string url = base_url;
  if (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  return url;
}

// Vimeo error bodies look like {"error": "...", "developer_message": "...", "error_code": 2204}.
std::string extract_error_message(const json& payload) {
  if (!payload.is_object()) {
    return {};
  }
  std::string message = payload.value("error", "");
  std::string developer_message = payload.value("developer_message", "");
  if (message.empty()) {
    return developer_message;
  }
  if (!developer_message.empty() && developer_message != message) {
    message += " (" + developer_message + ")";
  }
  return message;
}

bool is_sensitive_header(const std::string& key) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  return kSensitive.count(to_lower(key)) > 0;
}

json sanitize_headers(const std::map<std::string, std::string>& headers) {
  json sanitized = json::object();
  for (const auto& [key, value] : headers) {
    sanitized[key] = is_sensitive_header(key) ? "***" : value;
  }
  return sanitized;
}

json sanitize_headers(const HttpHeaders& headers) {
  json sanitized = json::object();
  for (const auto& [key, value] : headers) {
    sanitized[key] = is_sensitive_header(key) ? "***" : value;
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request, std::size_t retry_count) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["retry_count"] = static_cast<int>(retry_count);
  details["headers"] = sanitize_headers(request.headers);
  details["body_bytes"] = request.body.size();
  return details;
}

json build_response_log_details(const HttpRequest& request,
                                const HttpResponse& response,
                                std::chrono::steady_clock::duration duration,
                                std::size_t retry_count) {
  json details = build_request_log_details(request, retry_count);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response.headers);
  return details;
}

RequestError make_status_error(const HttpResponse& response) {
  RequestError error;
  error.kind = RequestErrorKind::Status;
  error.status_code = response.status_code;
  error.headers = response.headers;
  if (auto payload = utils::safe_json(response.body)) {
    error.message = extract_error_message(*payload);
    error.body = std::move(*payload);
  }
  if (error.message.empty()) {
    error.message = "HTTP " + std::to_string(response.status_code) + " error";
  }
  return error;
}

}  // namespace

VimeoClient::VimeoClient(ClientOptions options,
                         std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      videos_(*this),
      uploads_(*this) {
  if (options_.access_token.empty()) {
    if (auto env_token = utils::read_env("VIMEO_ACCESS_TOKEN")) {
      options_.access_token = *env_token;
    }
  }

  if (auto env_base = utils::read_env("VIMEO_BASE_URL")) {
    if (!env_base->empty() && options_.base_url == kDefaultBaseUrl) {
      options_.base_url = *env_base;
    }
  }
  if (options_.base_url.empty()) {
    options_.base_url = kDefaultBaseUrl;
  }

  if (options_.timeout == kDefaultTimeout) {
    if (auto env_timeout = utils::read_env_milliseconds("VIMEO_TIMEOUT_MS")) {
      options_.timeout = *env_timeout;
    }
  }

  if (options_.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("VIMEO_LOG")) {
      if (!env_log->empty()) {
        options_.log_level = parse_log_level(*env_log, options_.log_level);
      }
    }
  }

  if (options_.access_token.empty()) {
    throw VimeoError("Missing access token. Provide ClientOptions.access_token or set the VIMEO_ACCESS_TOKEN environment variable.");
  }

  utils::validate_positive_integer("ClientOptions.timeout", options_.timeout.count());
}

void VimeoClient::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!options_.logger) {
    return;
  }
  if (static_cast<int>(level) > static_cast<int>(options_.log_level)) {
    return;
  }
  options_.logger(level, message, details);
}

std::string VimeoClient::resolve_url(const std::string& target) const {
  return build_url(options_.base_url, target);
}

bool VimeoClient::targets_api(const std::string& url) const {
  std::string base = options_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (url.size() < base.size() || to_lower(url.substr(0, base.size())) != to_lower(base)) {
    return false;
  }
  // "https://api.vimeo.com.example.net" must not match "https://api.vimeo.com".
  if (url.size() == base.size()) {
    return true;
  }
  char next = url[base.size()];
  return next == '/' || next == '?' || next == '#';
}

ExchangeResult VimeoClient::exchange(const std::string& method,
                                     const std::string& target,
                                     const std::string& body,
                                     const RequestOptions& options) const {
  if (options.timeout) {
    utils::validate_positive_integer("RequestOptions.timeout", options.timeout->count());
  }
  const std::size_t max_retries = options.max_retries.value_or(options_.max_retries);
  std::size_t retries_remaining = max_retries;

  const std::string url = utils::qs::append_to_url(resolve_url(target), options.query_params);
  const bool authorize = targets_api(url);

  auto build_request = [&]() {
    HttpRequest http_request;
    http_request.method = method;
    http_request.url = url;
    http_request.body = body;
    http_request.timeout = options.timeout.value_or(options_.timeout);

    std::map<std::string, std::string> headers;
    headers["Accept"] = "application/vnd.vimeo.*+json;version=" + options_.api_version;
    headers["User-Agent"] = utils::user_agent();
    if (authorize) {
      headers["Authorization"] = "bearer " + options_.access_token;
    }

    for (const auto& [key, value] : options_.default_headers) {
      headers[key] = value;
    }

    // The API expects JSON unless the caller says otherwise.
    if (!body.empty()) {
      headers["Content-Type"] = "application/json";
    }

    apply_optional_entries(headers, options.headers);
    http_request.headers = std::move(headers);
    return http_request;
  };

  while (true) {
    const std::size_t retry_count = max_retries - retries_remaining;
    HttpRequest http_request = build_request();
    log(LogLevel::Debug, "sending request", build_request_log_details(http_request, retry_count));
    auto start_time = std::chrono::steady_clock::now();

    HttpResponse response;
    std::optional<RequestError> connection_failure;
    try {
      response = http_client_->request(http_request);
    } catch (const APIConnectionTimeoutError& error) {
      connection_failure = RequestError{RequestErrorKind::Timeout, "", error.what(), 0, json::object(), {}};
    } catch (const std::exception& error) {
      connection_failure = RequestError{RequestErrorKind::Connection, "", error.what(), 0, json::object(), {}};
    }

    if (connection_failure) {
      auto details = build_request_log_details(http_request, retry_count);
      details["error"] = connection_failure->message;
      if (retries_remaining == 0) {
        log(LogLevel::Error, "request failed", details);
        return ExchangeResult{HttpResponse{}, std::move(connection_failure)};
      }
      log(LogLevel::Warn, "request failed, retrying", details);
      utils::sleep_for(compute_retry_delay(nullptr, retries_remaining, max_retries));
      --retries_remaining;
      continue;
    }

    auto duration = std::chrono::steady_clock::now() - start_time;
    if (response.status_code < 400) {
      log(LogLevel::Info, "request succeeded", build_response_log_details(http_request, response, duration, retry_count));
      return ExchangeResult{std::move(response), std::nullopt};
    }

    if (retries_remaining > 0 && should_retry_status(response.status_code)) {
      auto delay = compute_retry_delay(&response, retries_remaining, max_retries);
      auto details = build_response_log_details(http_request, response, duration, retry_count);
      details["retry_delay_ms"] = delay.count();
      log(LogLevel::Warn, "retrying request after error", details);
      utils::sleep_for(delay);
      --retries_remaining;
      continue;
    }

    log(LogLevel::Error, "request failed", build_response_log_details(http_request, response, duration, retry_count));
    RequestError error = make_status_error(response);
    return ExchangeResult{std::move(response), std::move(error)};
  }
}

HttpResponse VimeoClient::request(const std::string& method,
                                  const std::string& target,
                                  const std::string& body,
                                  const RequestOptions& options) const {
  auto result = exchange(method, target, body, options);
  if (result.error) {
    result.error->raise();
  }
  return std::move(result.response);
}

}  // namespace vimeo
