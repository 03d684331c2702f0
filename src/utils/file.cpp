#include "vimeo/utils/file.hpp"

#include "vimeo/error.hpp"

#include <array>
#include <filesystem>
#include <fstream>

namespace vimeo::utils {

std::string read_all_bytes(std::istream& stream) {
  std::string buffer;
  std::array<char, 64 * 1024> chunk{};
  while (stream.good()) {
    stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    std::streamsize count = stream.gcount();
    if (count > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(count));
    }
  }
  if (!stream.eof() && stream.fail()) {
    throw VimeoError("Failed to read data from stream");
  }
  return buffer;
}

std::string read_file_bytes(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw VimeoError("Not a regular file: " + path);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw VimeoError("Failed to open file: " + path);
  }
  try {
    return read_all_bytes(file);
  } catch (const VimeoError&) {
    throw VimeoError("Failed to read file: " + path);
  }
}

std::string file_basename(const std::string& path) {
  auto filename = std::filesystem::path(path).filename().string();
  if (filename.empty()) {
    return "file";
  }
  return filename;
}

}  // namespace vimeo::utils
