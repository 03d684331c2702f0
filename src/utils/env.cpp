#include "vimeo/utils/env.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace vimeo::utils {
namespace {

std::string_view trim_view(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  return std::string(trim_view(raw));
}

std::optional<std::chrono::milliseconds> read_env_milliseconds(const std::string& name) {
  auto value = read_env(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  long long parsed = 0;
  const char* first = value->data();
  const char* last = first + value->size();
  auto [end, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || end != last || parsed < 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(parsed);
}

}  // namespace vimeo::utils
