#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace vimeo::utils {

/**
 * Reads an environment variable with surrounding whitespace removed.
 * Returns std::nullopt when the variable is not set; a variable that is set
 * but blank yields an empty string.
 */
std::optional<std::string> read_env(const std::string& name);

/**
 * Reads a whole number of milliseconds. Unset, blank, negative or
 * non-numeric values yield std::nullopt.
 */
std::optional<std::chrono::milliseconds> read_env_milliseconds(const std::string& name);

}  // namespace vimeo::utils
