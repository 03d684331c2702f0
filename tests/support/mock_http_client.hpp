#pragma once

#include "vimeo/error.hpp"
#include "vimeo/http_client.hpp"

#include <mutex>
#include <optional>
#include <queue>
#include <variant>
#include <vector>

namespace vimeo::testing {

/**
 * In-memory HttpClient that replays queued responses and records every
 * request it receives, in order.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    std::string message;
    bool timeout = false;
  };

  using Enqueued = std::variant<HttpResponse, EnqueuedError>;

  HttpResponse request(const HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (responses_.empty()) {
      throw VimeoError("MockHttpClient queue underflow");
    }

    auto next = std::move(responses_.front());
    responses_.pop();

    if (std::holds_alternative<EnqueuedError>(next)) {
      const auto& error = std::get<EnqueuedError>(next);
      if (error.timeout) {
        throw APIConnectionTimeoutError(error.message);
      }
      throw APIConnectionError(error.message);
    }
    return std::get<HttpResponse>(next);
  }

  void enqueue_response(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(std::move(response));
  }

  void enqueue_response(long status, std::string body, HttpHeaders headers = {}) {
    enqueue_response(HttpResponse{status, std::move(headers), std::move(body)});
  }

  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message), false});
  }

  void enqueue_timeout(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message), true});
  }

  [[nodiscard]] const std::vector<HttpRequest>& requests() const {
    return requests_;
  }

  [[nodiscard]] std::optional<HttpRequest> last_request() const {
    if (requests_.empty()) {
      return std::nullopt;
    }
    return requests_.back();
  }

  [[nodiscard]] std::size_t pending() const {
    return responses_.size();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_ = {};
    requests_.clear();
  }

private:
  std::queue<Enqueued> responses_;
  std::vector<HttpRequest> requests_;
  std::mutex mutex_;
};

}  // namespace vimeo::testing
