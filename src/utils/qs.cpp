#include "vimeo/utils/qs.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace vimeo::utils::qs {
namespace {

bool is_unreserved(unsigned char c, Format format) {
  if (std::isalnum(c) != 0) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      return true;
    case '(':
    case ')':
      return format == Format::RFC1738;
    default:
      return false;
  }
}

}  // namespace

std::string encode(const std::string& input, Format format) {
  if (input.empty()) {
    return input;
  }

  std::ostringstream encoded;
  encoded << std::uppercase << std::hex;

  for (unsigned char byte : input) {
    if (is_unreserved(byte, format)) {
      encoded << static_cast<char>(byte);
    } else if (byte == ' ' && format == Format::RFC1738) {
      encoded << '+';
    } else {
      encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
  }

  return encoded.str();
}

std::string stringify(const QueryParams& params, const StringifyOptions& options) {
  std::string joined;
  for (const auto& [key, value] : params) {
    if (options.skip_empty_values && value.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += options.delimiter;
    }
    joined += encode(key, options.format);
    joined += '=';
    joined += encode(value, options.format);
  }
  if (joined.empty()) {
    return joined;
  }
  return options.add_query_prefix ? "?" + joined : joined;
}

std::string append_to_url(const std::string& url, const QueryParams& params) {
  std::string query_string = stringify(params);
  if (query_string.empty()) {
    return url;
  }
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  if (!url.empty() && (url.back() == '?' || url.back() == '&')) {
    return url + query_string;
  }
  return url + separator + query_string;
}

}  // namespace vimeo::utils::qs
