#include "vimeo/utils/platform.hpp"

#include <sstream>
#include <string>

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace vimeo::utils {
namespace {

#ifdef VIMEO_CPP_VERSION
constexpr const char* kPackageVersion = VIMEO_CPP_VERSION;
#else
constexpr const char* kPackageVersion = "0.0.0-dev";
#endif

std::string detect_os() {
#if defined(__APPLE__) && defined(__MACH__)
#if defined(TARGET_OS_IPHONE) && TARGET_OS_IPHONE
  return "iOS";
#else
  return "MacOS";
#endif
#elif defined(__ANDROID__)
  return "Android";
#elif defined(_WIN32)
  return "Windows";
#elif defined(__linux__)
  return "Linux";
#elif defined(__FreeBSD__)
  return "FreeBSD";
#elif defined(__unix__)
  return "Unix";
#else
  return "Unknown";
#endif
}

std::string detect_arch() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x64";
#elif defined(__i386__) || defined(_M_IX86)
  return "x32";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#else
  return "unknown";
#endif
}

std::string detect_compiler() {
  std::ostringstream oss;
#if defined(__clang__)
  oss << "clang " << __clang_major__ << '.' << __clang_minor__ << '.' << __clang_patchlevel__;
#elif defined(_MSC_VER)
  oss << "msvc " << (_MSC_VER / 100) << '.' << (_MSC_VER % 100);
#elif defined(__GNUC__)
  oss << "gcc " << __GNUC__ << '.' << __GNUC_MINOR__ << '.' << __GNUC_PATCHLEVEL__;
#else
  oss << "unknown";
#endif
  return oss.str();
}

}  // namespace

const PlatformProperties& platform_properties() {
  static const PlatformProperties props{kPackageVersion, detect_os(), detect_arch(), detect_compiler()};
  return props;
}

std::string user_agent() {
  const auto& props = platform_properties();
  return "vimeo-cpp/" + props.package_version + " (" + props.os + "; " + props.arch + "; " + props.compiler + ")";
}

}  // namespace vimeo::utils
