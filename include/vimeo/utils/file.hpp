#pragma once

#include <istream>
#include <string>

namespace vimeo::utils {

/**
 * Reads all bytes from the stream until EOF. Throws VimeoError when the
 * stream fails before reaching EOF.
 */
std::string read_all_bytes(std::istream& stream);

/**
 * Reads a whole file in binary mode. Throws VimeoError when the file cannot
 * be opened or read.
 */
std::string read_file_bytes(const std::string& path);

/** Final component of a filesystem path, or "file" when there is none. */
std::string file_basename(const std::string& path);

}  // namespace vimeo::utils
