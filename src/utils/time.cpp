#include "vimeo/utils/time.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace vimeo::utils {
namespace {

constexpr std::chrono::milliseconds kInitialRetryDelay{500};
constexpr std::chrono::milliseconds kMaxRetryDelay{8000};

}  // namespace

void sleep_for(std::chrono::milliseconds duration) {
  if (duration.count() <= 0) {
    return;
  }
  std::this_thread::sleep_for(duration);
}

double retry_jitter_factor() {
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_real_distribution<double> dist(0.0, 0.25);
  return 1.0 - dist(rng);
}

std::chrono::milliseconds calculate_backoff_delay(std::size_t attempt,
                                                  std::chrono::milliseconds initial,
                                                  std::chrono::milliseconds max,
                                                  std::optional<double> jitter_factor) {
  double jitter = std::max(0.0, jitter_factor.value_or(retry_jitter_factor()));
  if (initial.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  double delay_ms = static_cast<double>(initial.count()) * std::pow(2.0, static_cast<double>(attempt));
  delay_ms = std::min(delay_ms, static_cast<double>(std::max(initial, max).count()));
  delay_ms *= jitter;

  return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

std::chrono::milliseconds calculate_default_retry_delay(std::size_t retries_remaining,
                                                        std::size_t max_retries,
                                                        std::optional<double> jitter_factor) {
  if (max_retries == 0) {
    return calculate_backoff_delay(0, kInitialRetryDelay, kMaxRetryDelay, 1.0);
  }
  std::size_t attempt = max_retries > retries_remaining ? max_retries - retries_remaining : 0;
  return calculate_backoff_delay(attempt, kInitialRetryDelay, kMaxRetryDelay, jitter_factor);
}

}  // namespace vimeo::utils
