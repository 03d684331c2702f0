#pragma once

#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vimeo::testing {

/**
 * Sets (or unsets, for std::nullopt) one environment variable for the
 * lifetime of the guard and restores the previous value afterwards.
 */
class EnvVarGuard {
public:
  EnvVarGuard(std::string name, const std::optional<std::string>& value)
      : name_(std::move(name)) {
    if (const char* existing = std::getenv(name_.c_str())) {
      previous_ = std::string(existing);
    }
    assign(value);
  }

  EnvVarGuard(const EnvVarGuard&) = delete;
  EnvVarGuard& operator=(const EnvVarGuard&) = delete;

  ~EnvVarGuard() { assign(previous_); }

private:
  void assign(const std::optional<std::string>& value) const {
    if (value) {
      ::setenv(name_.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  std::string name_;
  std::optional<std::string> previous_;
};

/** Clears every VIMEO_* variable the client reads so tests start from a blank slate. */
class CleanVimeoEnvironment {
public:
  CleanVimeoEnvironment() {
    for (const char* name : {"VIMEO_ACCESS_TOKEN", "VIMEO_BASE_URL", "VIMEO_TIMEOUT_MS", "VIMEO_LOG"}) {
      guards_.push_back(std::make_unique<EnvVarGuard>(name, std::nullopt));
    }
  }

  CleanVimeoEnvironment(const CleanVimeoEnvironment&) = delete;
  CleanVimeoEnvironment& operator=(const CleanVimeoEnvironment&) = delete;

private:
  std::vector<std::unique_ptr<EnvVarGuard>> guards_;
};

}  // namespace vimeo::testing
