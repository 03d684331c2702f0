#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vimeo {

struct ProgressUpdate {
  std::uint64_t offset = 0;
  bool made_progress = false;

  bool operator==(const ProgressUpdate& other) const {
    return offset == other.offset && made_progress == other.made_progress;
  }
};

/**
 * Interprets a `Range` response header such as "bytes 0-499".
 *
 * Only the number after the first '-' is used. When there is no '-', the
 * tail is not a non-negative integer, or the value exceeds `total_length`,
 * the previous offset is kept and `made_progress` is false. A value below the
 * previous offset is accepted as reported.
 */
ProgressUpdate next_offset(std::string_view range_header, std::uint64_t previous_offset, std::uint64_t total_length);

enum class ProgressStatus { Progress, NoProgressRetry, Abort, Complete };

struct ProgressDecision {
  ProgressStatus status = ProgressStatus::NoProgressRetry;
  std::uint64_t offset = 0;
  // Consecutive rounds without forward progress, including this one.
  std::size_t stalled_rounds = 0;
};

/**
 * Server-confirmed portion of the file for one upload session.
 */
struct TransferWindow {
  std::uint64_t confirmed_offset = 0;
  std::uint64_t total_length = 0;
  std::size_t stalled_rounds = 0;

  bool complete() const { return confirmed_offset >= total_length; }

  /**
   * Decides the next step from a probe's `Range` header (std::nullopt when
   * the response had none). Pure; apply the result with `apply`.
   *
   * A round stalls when the header is unusable or the offset does not move
   * forward. Reaching `max_stalled_rounds` consecutive stalls aborts.
   */
  ProgressDecision advance(std::optional<std::string_view> range_header, std::size_t max_stalled_rounds) const;

  void apply(const ProgressDecision& decision);
};

}  // namespace vimeo
