#include "vimeo/http_client.hpp"

#include "vimeo/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

namespace vimeo {
namespace {

void trim(std::string& s) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<HttpHeaders*>(userdata);
  // A status line starts a new header block (interim 100 responses, redirects).
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return total_size;
  }

  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);
    trim(key);
    trim(value);
    if (!key.empty()) {
      headers->emplace(std::move(key), std::move(value));
    }
  }

  return total_size;
}

bool method_sends_body(const std::string& method) {
  return method == "POST" || method == "PUT" || method == "PATCH";
}

bool has_header(const std::map<std::string, std::string>& headers, std::string_view name) {
  CaseInsensitiveLess less;
  return std::any_of(headers.begin(), headers.end(), [&](const auto& entry) {
    return !less(entry.first, name) && !less(name, entry.first);
  });
}

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
      throw APIConnectionError("Failed to initialize libcurl");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      raw_list = curl_slist_append(raw_list, header.c_str());
    }
    // libcurl would otherwise add a form Content-Type and an Expect header to bodies.
    if (method_sends_body(request.method)) {
      if (!has_header(request.headers, "Content-Type")) {
        raw_list = curl_slist_append(raw_list, "Content-Type:");
      }
      raw_list = curl_slist_append(raw_list, "Expect:");
    }
    SlistPtr header_list(raw_list, &curl_slist_free_all);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

    if (method_sends_body(request.method)) {
      // Always attach the body, even an empty one, so Content-Length is sent.
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
      throw APIConnectionTimeoutError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
      throw APIConnectionError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

bool CaseInsensitiveLess::operator()(std::string_view lhs, std::string_view rhs) const {
  return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
  });
}

std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name) {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace vimeo
