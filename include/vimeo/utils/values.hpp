#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "vimeo/error.hpp"

namespace vimeo::utils {

bool is_absolute_url(std::string_view url);

/**
 * Returns the text after the final '/' of a URL or path, ignoring any query
 * string or fragment. "/videos/12345?x=1" yields "12345".
 */
std::string last_path_segment(std::string_view url);

template <typename Integer,
          typename = std::enable_if_t<std::is_integral_v<Integer>>>
Integer validate_positive_integer(const std::string& name, Integer value) {
  if (value < 0) {
    throw VimeoError(name + " must be a positive integer");
  }
  return value;
}

std::optional<nlohmann::json> safe_json(const std::string& text);

/**
 * Accepts integers, integral floats and numeric strings ("42").
 * Throws VimeoError for anything else.
 */
std::int64_t coerce_integer(const nlohmann::json& value);

/** Like coerce_integer, but null yields std::nullopt. */
std::optional<std::int64_t> maybe_coerce_integer(const nlohmann::json& value);

/**
 * Reads `key` from an object when it holds a string; missing keys, nulls and
 * other types yield std::nullopt.
 */
std::optional<std::string> optional_string(const nlohmann::json& object, const std::string& key);

}  // namespace vimeo::utils
