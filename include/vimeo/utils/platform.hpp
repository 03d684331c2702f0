#pragma once

#include <string>

namespace vimeo::utils {

struct PlatformProperties {
  std::string package_version;
  std::string os;
  std::string arch;
  std::string compiler;
};

/** Cached description of the build and host platform. */
const PlatformProperties& platform_properties();

/** Default User-Agent, e.g. "vimeo-cpp/0.1.0 (Linux; x64; gcc 13.2.0)". */
std::string user_agent();

}  // namespace vimeo::utils
