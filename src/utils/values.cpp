#include "vimeo/utils/values.hpp"

#include <cctype>
#include <cmath>
#include <string>

namespace vimeo::utils {
namespace {

[[noreturn]] void throw_coerce_error(const nlohmann::json& value, const std::string& type) {
  throw VimeoError("Could not coerce " + value.dump() + " (type: " + type + ") into an integer");
}

}  // namespace

bool is_absolute_url(std::string_view url) {
  auto colon_pos = url.find(':');
  if (colon_pos == std::string_view::npos || colon_pos == 0) {
    return false;
  }

  if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
    return false;
  }

  for (std::size_t i = 1; i < colon_pos; ++i) {
    unsigned char ch = static_cast<unsigned char>(url[i]);
    if (!(std::isalnum(ch) || ch == '+' || ch == '.' || ch == '-')) {
      return false;
    }
  }

  return true;
}

std::string last_path_segment(std::string_view url) {
  auto cut = url.find_first_of("?#");
  if (cut != std::string_view::npos) {
    url = url.substr(0, cut);
  }
  while (!url.empty() && url.back() == '/') {
    url.remove_suffix(1);
  }
  auto slash = url.find_last_of('/');
  if (slash == std::string_view::npos) {
    return std::string(url);
  }
  return std::string(url.substr(slash + 1));
}

std::optional<nlohmann::json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

std::int64_t coerce_integer(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    double number = value.get<double>();
    if (!std::isfinite(number)) {
      throw_coerce_error(value, "number");
    }
    return static_cast<std::int64_t>(std::llround(number));
  }
  if (value.is_string()) {
    const auto& str = value.get_ref<const std::string&>();
    std::size_t idx = 0;
    long long result = 0;
    try {
      result = std::stoll(str, &idx, 10);
    } catch (const std::logic_error&) {
      throw_coerce_error(value, "string");
    }
    if (idx != str.size()) {
      throw_coerce_error(value, "string");
    }
    return result;
  }
  throw_coerce_error(value, value.type_name());
}

std::optional<std::int64_t> maybe_coerce_integer(const nlohmann::json& value) {
  if (value.is_null()) {
    return std::nullopt;
  }
  return coerce_integer(value);
}

std::optional<std::string> optional_string(const nlohmann::json& object, const std::string& key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace vimeo::utils
