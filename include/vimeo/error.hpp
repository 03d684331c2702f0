#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "vimeo/http_client.hpp"

namespace vimeo {

class VimeoError : public std::runtime_error {
public:
  explicit VimeoError(const std::string& message)
      : std::runtime_error(message) {}
};

class APIError : public VimeoError {
public:
  APIError(std::string message,
           long status_code,
           nlohmann::json error_body,
           HttpHeaders headers)
      : VimeoError(std::move(message)),
        status_code_(status_code),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const HttpHeaders& headers() const { return headers_; }

private:
  long status_code_;
  nlohmann::json error_body_;
  HttpHeaders headers_;
};

class BadRequestError : public APIError {
public:
  using APIError::APIError;
};

class AuthenticationError : public APIError {
public:
  using APIError::APIError;
};

class PermissionDeniedError : public APIError {
public:
  using APIError::APIError;
};

class NotFoundError : public APIError {
public:
  using APIError::APIError;
};

class ConflictError : public APIError {
public:
  using APIError::APIError;
};

class UnprocessableEntityError : public APIError {
public:
  using APIError::APIError;
};

class RateLimitError : public APIError {
public:
  using APIError::APIError;
};

class InternalServerError : public APIError {
public:
  using APIError::APIError;
};

class APIConnectionError : public VimeoError {
public:
  explicit APIConnectionError(const std::string& message)
      : VimeoError(message) {}
};

class APIConnectionTimeoutError : public APIConnectionError {
public:
  using APIConnectionError::APIConnectionError;
};

[[noreturn]] void throw_api_error(long status,
                                  const std::string& message,
                                  const nlohmann::json& error_body,
                                  const HttpHeaders& headers);

enum class RequestErrorKind { Connection, Timeout, Status, Local };

const char* to_string(RequestErrorKind kind);

/**
 * A failed step captured as a value rather than thrown.
 *
 * `Connection` and `Timeout` mean no response arrived, `Status` carries the
 * server's non-success response, and `Local` marks a client-side decision to
 * stop (undecodable ticket, missing Location header, stalled transfer).
 */
struct RequestError {
  RequestErrorKind kind = RequestErrorKind::Local;
  std::string step;
  std::string message;
  long status_code = 0;
  nlohmann::json body = nlohmann::json::object();
  HttpHeaders headers;

  /** Throws the exception type matching this error. */
  [[noreturn]] void raise() const;
};

}  // namespace vimeo
