#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace vimeo::utils {

void sleep_for(std::chrono::milliseconds duration);

/** Multiplier in [0.75, 1.0] applied to backoff delays. */
double retry_jitter_factor();

/**
 * Exponential backoff: `initial * 2^attempt`, capped at `max`, then scaled by
 * the jitter factor. `attempt` counts from zero.
 */
std::chrono::milliseconds calculate_backoff_delay(std::size_t attempt,
                                                  std::chrono::milliseconds initial,
                                                  std::chrono::milliseconds max,
                                                  std::optional<double> jitter_factor = std::nullopt);

/** Backoff used between request retries (0.5 s doubling up to 8 s). */
std::chrono::milliseconds calculate_default_retry_delay(std::size_t retries_remaining,
                                                        std::size_t max_retries,
                                                        std::optional<double> jitter_factor = std::nullopt);

}  // namespace vimeo::utils
