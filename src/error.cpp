#include "vimeo/error.hpp"

namespace vimeo {

void throw_api_error(long status,
                     const std::string& message,
                     const nlohmann::json& error_body,
                     const HttpHeaders& headers) {
  const std::string text = message.empty() ? ("HTTP " + std::to_string(status) + " error") : message;

  switch (status) {
    case 400:
      throw BadRequestError(text, status, error_body, headers);
    case 401:
      throw AuthenticationError(text, status, error_body, headers);
    case 403:
      throw PermissionDeniedError(text, status, error_body, headers);
    case 404:
      throw NotFoundError(text, status, error_body, headers);
    case 409:
      throw ConflictError(text, status, error_body, headers);
    case 422:
      throw UnprocessableEntityError(text, status, error_body, headers);
    case 429:
      throw RateLimitError(text, status, error_body, headers);
    default:
      if (status >= 500) {
        throw InternalServerError(text, status, error_body, headers);
      }
      throw APIError(text, status, error_body, headers);
  }
}

const char* to_string(RequestErrorKind kind) {
  switch (kind) {
    case RequestErrorKind::Connection:
      return "connection";
    case RequestErrorKind::Timeout:
      return "timeout";
    case RequestErrorKind::Status:
      return "status";
    case RequestErrorKind::Local:
      return "local";
  }
  return "local";
}

void RequestError::raise() const {
  switch (kind) {
    case RequestErrorKind::Connection:
      throw APIConnectionError(message);
    case RequestErrorKind::Timeout:
      throw APIConnectionTimeoutError(message);
    case RequestErrorKind::Status:
      throw_api_error(status_code, message, body, headers);
    case RequestErrorKind::Local:
      break;
  }
  throw VimeoError(message);
}

}  // namespace vimeo
