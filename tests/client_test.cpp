#include <gtest/gtest.h>

#include "vimeo/client.hpp"
#include "vimeo/error.hpp"
#include "vimeo/logging.hpp"
#include "vimeo/utils/platform.hpp"

#include "support/env_guard.hpp"
#include "support/mock_http_client.hpp"

#include <tuple>

using vimeo::APIConnectionError;
using vimeo::APIConnectionTimeoutError;
using vimeo::AuthenticationError;
using vimeo::BadRequestError;
using vimeo::ClientOptions;
using vimeo::HttpResponse;
using vimeo::InternalServerError;
using vimeo::LogLevel;
using vimeo::RequestErrorKind;
using vimeo::RequestOptions;
using vimeo::VimeoClient;
using vimeo::VimeoError;
namespace mock = vimeo::testing;
namespace utils = vimeo::utils;

namespace {

ClientOptions test_options() {
  ClientOptions options;
  options.access_token = "token-123";
  return options;
}

}  // namespace

TEST(VimeoClientHeadersTest, SendsAcceptUserAgentAndBearerToken) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(200, R"({"uri":"/videos/1"})");

  VimeoClient client(test_options(), std::move(http_mock));
  client.request("GET", "/me", "");

  auto captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->url, "https://api.vimeo.com/me");
  EXPECT_EQ(captured->headers.at("Accept"), "application/vnd.vimeo.*+json;version=3.4");
  EXPECT_EQ(captured->headers.at("User-Agent"), utils::user_agent());
  EXPECT_EQ(captured->headers.at("Authorization"), "bearer token-123");
  EXPECT_EQ(captured->headers.find("Content-Type"), captured->headers.end());
}

TEST(VimeoClientHeadersTest, JsonBodiesGetJsonContentType) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(200, "{}");

  VimeoClient client(test_options(), std::move(http_mock));
  client.request("PATCH", "/videos/1", R"({"name":"x"})");

  auto captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->headers.at("Content-Type"), "application/json");
  EXPECT_EQ(captured->body, R"({"name":"x"})");
}

TEST(VimeoClientHeadersTest, TokenIsNotSentToOtherHosts) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(200, "");
  mock_ptr->enqueue_response(200, "");

  VimeoClient client(test_options(), std::move(http_mock));
  client.request("PUT", "https://files.tus.vimeo.com/upload?ticket=abc", "");
  client.request("GET", "https://api.vimeo.com.attacker.example/me", "");

  const auto& requests = mock_ptr->requests();
  ASSERT_EQ(requests.size(), 2u);
  for (const auto& request : requests) {
    EXPECT_EQ(request.headers.find("Authorization"), request.headers.end()) << request.url;
  }
}

TEST(VimeoClientHeadersTest, DefaultHeadersAppliedAndOverridable) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(200, "{}");

  ClientOptions options = test_options();
  options.default_headers["X-Test-Default"] = "alpha";
  options.default_headers["X-Remove"] = "beta";

  VimeoClient client(std::move(options), std::move(http_mock));

  RequestOptions request_options;
  request_options.headers["X-Remove"] = std::nullopt;
  request_options.headers["X-New"] = std::string("gamma");
  request_options.query_params.emplace_back("fields", "uri,name");
  client.request("GET", "/me/videos/1", "", request_options);

  auto captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->headers.at("X-Test-Default"), "alpha");
  EXPECT_EQ(captured->headers.find("X-Remove"), captured->headers.end());
  EXPECT_EQ(captured->headers.at("X-New"), "gamma");
  EXPECT_EQ(captured->url, "https://api.vimeo.com/me/videos/1?fields=uri%2Cname");
}

TEST(VimeoClientConfigTest, MissingTokenThrows) {
  mock::CleanVimeoEnvironment env;
  EXPECT_THROW(VimeoClient(ClientOptions{}, std::make_unique<mock::MockHttpClient>()), VimeoError);
}

TEST(VimeoClientConfigTest, ReadsSettingsFromEnvironment) {
  mock::CleanVimeoEnvironment env;
  mock::EnvVarGuard token("VIMEO_ACCESS_TOKEN", std::string("env-token"));
  mock::EnvVarGuard base("VIMEO_BASE_URL", std::string("http://localhost:8080"));
  mock::EnvVarGuard timeout("VIMEO_TIMEOUT_MS", std::string("1500"));
  mock::EnvVarGuard log("VIMEO_LOG", std::string("debug"));

  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(200, "{}");

  VimeoClient client(ClientOptions{}, std::move(http_mock));
  EXPECT_EQ(client.options().access_token, "env-token");
  EXPECT_EQ(client.options().base_url, "http://localhost:8080");
  EXPECT_EQ(client.options().timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(client.options().log_level, LogLevel::Debug);

  client.request("GET", "/me", "");
  auto captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->url, "http://localhost:8080/me");
  EXPECT_EQ(captured->headers.at("Authorization"), "bearer env-token");
  EXPECT_EQ(captured->timeout, std::chrono::milliseconds(1500));
}

TEST(VimeoClientConfigTest, ExplicitOptionsWinOverEnvironment) {
  mock::CleanVimeoEnvironment env;
  mock::EnvVarGuard token("VIMEO_ACCESS_TOKEN", std::string("env-token"));
  mock::EnvVarGuard base("VIMEO_BASE_URL", std::string("http://localhost:8080"));

  ClientOptions options = test_options();
  options.base_url = "http://127.0.0.1:9000";
  VimeoClient client(std::move(options), std::make_unique<mock::MockHttpClient>());

  EXPECT_EQ(client.options().access_token, "token-123");
  EXPECT_EQ(client.options().base_url, "http://127.0.0.1:9000");
}

TEST(VimeoClientLoggingTest, EmitsLogsWithSanitizedHeaders) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  vimeo::HttpHeaders response_headers;
  response_headers.emplace("Set-Cookie", "secret");
  mock_ptr->enqueue_response(200, "{}", response_headers);

  std::vector<std::tuple<LogLevel, std::string, nlohmann::json>> logs;

  ClientOptions options = test_options();
  options.logger = [&](LogLevel level, const std::string& message, const nlohmann::json& details) {
    logs.emplace_back(level, message, details);
  };
  options.log_level = LogLevel::Debug;

  VimeoClient client(std::move(options), std::move(http_mock));
  client.request("GET", "/me", "");

  bool found_request_log = false;
  bool found_response_log = false;
  for (const auto& [level, message, details] : logs) {
    if (message == "sending request") {
      found_request_log = true;
      EXPECT_EQ(level, LogLevel::Debug);
      EXPECT_EQ(details.at("headers").at("Authorization"), "***");
    }
    if (message == "request succeeded") {
      found_response_log = true;
      EXPECT_EQ(level, LogLevel::Info);
      EXPECT_EQ(details.at("response_headers").at("Set-Cookie"), "***");
    }
  }
  EXPECT_TRUE(found_request_log);
  EXPECT_TRUE(found_response_log);
}

TEST(VimeoClientLoggingTest, LevelFiltersLowerPriorityEntries) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_response(200, "{}");

  std::vector<LogLevel> levels;
  ClientOptions options = test_options();
  options.logger = [&](LogLevel level, const std::string&, const nlohmann::json&) { levels.push_back(level); };
  options.log_level = LogLevel::Warn;

  VimeoClient client(std::move(options), std::move(http_mock));
  client.request("GET", "/me", "");

  EXPECT_TRUE(levels.empty());
}

TEST(VimeoClientRetryTest, RetriesOnServerError) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  vimeo::HttpHeaders retry_headers;
  retry_headers.emplace("retry-after-ms", "1");
  mock_ptr->enqueue_response(503, R"({"error":"temporary"})", retry_headers);
  mock_ptr->enqueue_response(200, "{}");

  ClientOptions options = test_options();
  options.max_retries = 1;
  VimeoClient client(std::move(options), std::move(http_mock));

  auto response = client.request("GET", "/me", "");
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(mock_ptr->requests().size(), 2u);
}

TEST(VimeoClientRetryTest, DoesNotRetryOnClientError) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(400, R"({"error":"bad request","developer_message":"name is too long"})");

  ClientOptions options = test_options();
  options.max_retries = 2;
  VimeoClient client(std::move(options), std::move(http_mock));

  try {
    client.request("GET", "/me", "");
    FAIL() << "Expected BadRequestError";
  } catch (const BadRequestError& err) {
    EXPECT_EQ(err.status_code(), 400);
    EXPECT_EQ(std::string(err.what()), "bad request (name is too long)");
    EXPECT_EQ(err.error_body().at("developer_message"), "name is too long");
  }
  EXPECT_EQ(mock_ptr->requests().size(), 1u);
}

TEST(VimeoClientRetryTest, PerRequestMaxRetriesOverridesClientDefault) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(500, R"({"error":"temporary"})");
  mock_ptr->enqueue_response(200, "{}");

  ClientOptions options = test_options();
  options.max_retries = 2;
  VimeoClient client(std::move(options), std::move(http_mock));

  RequestOptions request_options;
  request_options.max_retries = 0;
  EXPECT_THROW(client.request("GET", "/me", "", request_options), InternalServerError);
  EXPECT_EQ(mock_ptr->requests().size(), 1u);
}

TEST(VimeoClientExchangeTest, ReportsStatusFailureAsData) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_response(401, R"({"error":"Unauthorized"})");

  VimeoClient client(test_options(), std::move(http_mock));
  auto result = client.exchange("GET", "/me", "");

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, RequestErrorKind::Status);
  EXPECT_EQ(result.error->status_code, 401);
  EXPECT_EQ(result.error->message, "Unauthorized");
  EXPECT_EQ(result.response.status_code, 401);
  EXPECT_THROW(result.error->raise(), AuthenticationError);
}

TEST(VimeoClientExchangeTest, ReportsConnectionAndTimeoutFailures) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_error("connection refused");
  http_mock->enqueue_timeout("timed out");

  ClientOptions options = test_options();
  options.max_retries = 0;
  VimeoClient client(std::move(options), std::move(http_mock));

  auto refused = client.exchange("GET", "/me", "");
  ASSERT_FALSE(refused.ok());
  EXPECT_EQ(refused.error->kind, RequestErrorKind::Connection);
  EXPECT_EQ(refused.error->message, "connection refused");
  EXPECT_TRUE(refused.response.headers.empty());

  auto timed_out = client.exchange("GET", "/me", "");
  ASSERT_FALSE(timed_out.ok());
  EXPECT_EQ(timed_out.error->kind, RequestErrorKind::Timeout);
  EXPECT_THROW(timed_out.error->raise(), APIConnectionTimeoutError);
}

TEST(VimeoClientExchangeTest, RetriesConnectionFailures) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_error("reset by peer");
  mock_ptr->enqueue_response(200, "{}");

  ClientOptions options = test_options();
  options.max_retries = 1;
  VimeoClient client(std::move(options), std::move(http_mock));

  auto result = client.exchange("GET", "/me", "");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(mock_ptr->requests().size(), 2u);
}

TEST(VimeoClientExchangeTest, RequestRaisesConnectionError) {
  mock::CleanVimeoEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_error("no route to host");

  ClientOptions options = test_options();
  options.max_retries = 0;
  VimeoClient client(std::move(options), std::move(http_mock));

  EXPECT_THROW(client.request("GET", "/me", ""), APIConnectionError);
}
