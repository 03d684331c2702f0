#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vimeo/error.hpp"
#include "vimeo/upload_progress.hpp"
#include "vimeo/video_properties.hpp"
#include "vimeo/videos.hpp"

namespace vimeo {

struct RequestOptions;
class VimeoClient;

/**
 * Server-issued descriptor for one streaming upload attempt.
 */
struct UploadTicket {
  std::string uri;
  std::string ticket_id;
  std::string upload_link_secure;
  std::string complete_uri;
  nlohmann::json user = nullptr;
  nlohmann::json raw = nlohmann::json::object();
};

/** Returns std::nullopt unless the payload names both upload endpoints. */
std::optional<UploadTicket> parse_upload_ticket(const nlohmann::json& payload);

struct UploadOptions {
  // Consecutive chunk/probe rounds without forward progress before giving up.
  std::size_t max_stalled_rounds = 5;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  // Overall budget for the transfer loop; unlimited when unset.
  std::optional<std::chrono::milliseconds> deadline;
  // Per-request timeout for chunk writes; the client timeout when unset.
  std::optional<std::chrono::milliseconds> chunk_timeout;
};

/**
 * Result of UploadsResource::upload_file.
 *
 * `errors` collects every failed step in order. `ticket` is set once a
 * session was issued, `video_id` once finalization returned a Location, and
 * `video` once the final fetch decoded.
 */
struct UploadOutcome {
  std::vector<RequestError> errors;
  std::optional<UploadTicket> ticket;
  std::optional<std::string> video_id;
  std::optional<Video> video;

  bool ok() const { return errors.empty() && video.has_value(); }
};

class UploadsResource {
public:
  explicit UploadsResource(VimeoClient& client) : client_(client) {}

  /** POST /me/videos {"type":"streaming"}. Throws when no ticket is issued. */
  UploadTicket create_ticket() const;
  UploadTicket create_ticket(const RequestOptions& options) const;

  /**
   * Uploads a local file through a streaming upload session, then applies
   * `properties` and fetches the resulting video.
   *
   * Throws VimeoError only when the file cannot be read; every later failure
   * is reported through UploadOutcome::errors.
   */
  UploadOutcome upload_file(const std::string& path,
                            const std::optional<VideoProperties>& properties = std::nullopt,
                            const UploadOptions& options = {}) const;

  /** Same protocol for bytes already in memory. */
  UploadOutcome upload_bytes(const std::string& data,
                             const std::optional<VideoProperties>& properties = std::nullopt,
                             const UploadOptions& options = {}) const;

private:
  VimeoClient& client_;
};

}  // namespace vimeo
