#pragma once

#include <string>
#include <utility>
#include <vector>

namespace vimeo::utils::qs {

enum class Format { RFC1738, RFC3986 };

/** Ordered key/value pairs; order is preserved in the encoded output. */
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct StringifyOptions {
  bool add_query_prefix = false;
  std::string delimiter = "&";
  Format format = Format::RFC3986;
  bool skip_empty_values = false;
};

/**
 * Percent-encodes every byte outside the unreserved set. RFC1738 output
 * additionally leaves parentheses alone and writes spaces as '+'.
 */
[[nodiscard]] std::string encode(const std::string& input, Format format = Format::RFC3986);

[[nodiscard]] std::string stringify(const QueryParams& params, const StringifyOptions& options = {});

/**
 * Appends an encoded query string to a URL, using '&' when the URL already
 * carries a query.
 */
[[nodiscard]] std::string append_to_url(const std::string& url, const QueryParams& params);

}  // namespace vimeo::utils::qs
