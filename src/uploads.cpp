#include "vimeo/uploads.hpp"

#include "vimeo/client.hpp"
#include "vimeo/error.hpp"
#include "vimeo/utils/file.hpp"
#include "vimeo/utils/time.hpp"
#include "vimeo/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string_view>
#include <utility>

namespace vimeo {
namespace {

using json = nlohmann::json;

constexpr const char* kMyVideosPath = "/me/videos";

RequestError local_error(std::string step, std::string message) {
  RequestError error;
  error.kind = RequestErrorKind::Local;
  error.step = std::move(step);
  error.message = std::move(message);
  return error;
}

std::string content_range(std::uint64_t offset, std::uint64_t total) {
  return "bytes " + std::to_string(offset) + "-" + std::to_string(total) + "/" + std::to_string(total);
}

}  // namespace

std::optional<UploadTicket> parse_upload_ticket(const json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto upload_link = utils::optional_string(payload, "upload_link_secure");
  auto complete_uri = utils::optional_string(payload, "complete_uri");
  if (!upload_link || upload_link->empty() || !complete_uri || complete_uri->empty()) {
    return std::nullopt;
  }
  UploadTicket ticket;
  ticket.raw = payload;
  ticket.uri = utils::optional_string(payload, "uri").value_or("");
  ticket.ticket_id = utils::optional_string(payload, "ticket_id").value_or("");
  ticket.upload_link_secure = std::move(*upload_link);
  ticket.complete_uri = std::move(*complete_uri);
  if (payload.contains("user")) {
    ticket.user = payload.at("user");
  }
  return ticket;
}

UploadTicket UploadsResource::create_ticket() const {
  return create_ticket(RequestOptions{});
}

UploadTicket UploadsResource::create_ticket(const RequestOptions& options) const {
  json body = {{"type", "streaming"}};
  RequestOptions ticket_options = options;
  if (!ticket_options.max_retries) {
    ticket_options.max_retries = 0;
  }
  auto response = client_.request("POST", kMyVideosPath, body.dump(), ticket_options);
  auto payload = utils::safe_json(response.body);
  if (!payload) {
    throw VimeoError("Failed to parse upload ticket response");
  }
  auto ticket = parse_upload_ticket(*payload);
  if (!ticket) {
    throw VimeoError("Upload ticket response is missing upload_link_secure or complete_uri");
  }
  return *ticket;
}

UploadOutcome UploadsResource::upload_file(const std::string& path,
                                           const std::optional<VideoProperties>& properties,
                                           const UploadOptions& options) const {
  std::string data = utils::read_file_bytes(path);
  client_.log(LogLevel::Info, "read upload source", {{"file", utils::file_basename(path)}, {"bytes", data.size()}});
  return upload_bytes(data, properties, options);
}

UploadOutcome UploadsResource::upload_bytes(const std::string& data,
                                            const std::optional<VideoProperties>& properties,
                                            const UploadOptions& options) const {
  UploadOutcome outcome;
  const auto started = std::chrono::steady_clock::now();

  auto record = [&](RequestError error, const char* step) {
    if (error.step.empty()) {
      error.step = step;
    }
    client_.log(LogLevel::Warn,
                "upload step failed",
                {{"step", error.step}, {"kind", to_string(error.kind)}, {"status", error.status_code},
                 {"message", error.message}});
    outcome.errors.push_back(std::move(error));
  };

  // 1. Session. Each POST opens a new session, so it is never re-sent.
  json ticket_request = {{"type", "streaming"}};
  RequestOptions ticket_options;
  ticket_options.max_retries = 0;
  auto created = client_.exchange("POST", kMyVideosPath, ticket_request.dump(), ticket_options);
  if (!created.ok()) {
    record(std::move(*created.error), "create_ticket");
    return outcome;
  }
  if (created.response.status_code != 201) {
    RequestError error;
    error.kind = RequestErrorKind::Status;
    error.message = "Expected 201 creating upload ticket, got " + std::to_string(created.response.status_code);
    error.status_code = created.response.status_code;
    error.headers = created.response.headers;
    if (auto payload = utils::safe_json(created.response.body)) {
      error.body = std::move(*payload);
    }
    record(std::move(error), "create_ticket");
    return outcome;
  }

  std::optional<UploadTicket> ticket;
  if (auto payload = utils::safe_json(created.response.body)) {
    ticket = parse_upload_ticket(*payload);
  }
  if (!ticket) {
    record(local_error("create_ticket", "Upload ticket response is missing upload_link_secure or complete_uri"),
           "create_ticket");
    return outcome;
  }
  outcome.ticket = ticket;
  client_.log(LogLevel::Info, "upload ticket issued", {{"ticket_id", ticket->ticket_id}, {"bytes", data.size()}});

  // 2. Transfer.
  TransferWindow window;
  window.total_length = data.size();

  while (!window.complete()) {
    if (options.deadline && std::chrono::steady_clock::now() - started >= *options.deadline) {
      record(local_error("upload_chunk", "Upload deadline exceeded at offset " + std::to_string(window.confirmed_offset)),
             "upload_chunk");
      return outcome;
    }

    RequestOptions chunk_options;
    chunk_options.headers["Content-Type"] = "application/octet-stream";
    chunk_options.headers["Content-Range"] = content_range(window.confirmed_offset, window.total_length);
    chunk_options.max_retries = 0;
    chunk_options.timeout = options.chunk_timeout;
    auto chunk = client_.exchange("PUT",
                                  ticket->upload_link_secure,
                                  data.substr(static_cast<std::size_t>(window.confirmed_offset)),
                                  chunk_options);
    if (!chunk.ok()) {
      record(std::move(*chunk.error), "upload_chunk");
    } else {
      client_.log(LogLevel::Debug,
                  "upload chunk sent",
                  {{"offset", window.confirmed_offset}, {"status", chunk.response.status_code}});
    }

    RequestOptions probe_options;
    probe_options.headers["Content-Range"] = "bytes */*";
    probe_options.max_retries = 0;
    auto probe = client_.exchange("PUT", ticket->upload_link_secure, "", probe_options);
    if (!probe.ok()) {
      const bool no_response = probe.error->kind == RequestErrorKind::Connection ||
                               probe.error->kind == RequestErrorKind::Timeout;
      record(std::move(*probe.error), "check_progress");
      if (no_response) {
        record(local_error("check_progress", "Could not verify upload progress"), "check_progress");
        return outcome;
      }
    }

    auto range = find_header(probe.response.headers, "Range");
    std::optional<std::string_view> range_view;
    if (range) {
      range_view = *range;
    }
    auto decision = window.advance(range_view, options.max_stalled_rounds);
    window.apply(decision);

    switch (decision.status) {
      case ProgressStatus::Complete:
      case ProgressStatus::Progress:
        client_.log(LogLevel::Debug,
                    "upload progress",
                    {{"offset", window.confirmed_offset}, {"total", window.total_length}});
        break;
      case ProgressStatus::NoProgressRetry: {
        auto delay = utils::calculate_backoff_delay(decision.stalled_rounds - 1,
                                                    options.initial_backoff,
                                                    options.max_backoff);
        client_.log(LogLevel::Warn,
                    "upload made no progress, retrying",
                    {{"offset", window.confirmed_offset},
                     {"stalled_rounds", decision.stalled_rounds},
                     {"delay_ms", delay.count()}});
        utils::sleep_for(delay);
        break;
      }
      case ProgressStatus::Abort:
        record(local_error("check_progress",
                           "Upload stalled at offset " + std::to_string(window.confirmed_offset) + " after " +
                               std::to_string(decision.stalled_rounds) + " rounds"),
               "check_progress");
        return outcome;
    }
  }

  // 3. Finalize.
  auto completed = client_.exchange("DELETE", ticket->complete_uri, "");
  if (!completed.ok()) {
    record(std::move(*completed.error), "complete");
  }
  auto location = find_header(completed.response.headers, "Location");
  if (!location || location->empty()) {
    record(local_error("complete", "Upload completion response has no Location header"), "complete");
    return outcome;
  }
  outcome.video_id = utils::last_path_segment(*location);
  client_.log(LogLevel::Info, "upload completed", {{"location", *location}, {"video_id", *outcome.video_id}});

  // 4. Properties.
  if (properties) {
    json patch = video_properties_to_json(*properties);
    if (!patch.empty()) {
      auto updated = client_.exchange("PATCH", *location, patch.dump());
      if (!updated.ok()) {
        record(std::move(*updated.error), "update");
      }
    }
  }

  // 5. Final metadata.
  auto fetched = client_.exchange("GET", std::string(kMyVideosPath) + "/" + *outcome.video_id, "");
  if (!fetched.ok()) {
    record(std::move(*fetched.error), "retrieve");
    return outcome;
  }
  auto payload = utils::safe_json(fetched.response.body);
  if (!payload || !payload->is_object()) {
    record(local_error("retrieve", "Failed to parse video retrieve response"), "retrieve");
    return outcome;
  }
  try {
    outcome.video = parse_video(*payload);
  } catch (const std::exception& ex) {
    record(local_error("retrieve", std::string("Failed to decode video: ") + ex.what()), "retrieve");
  }
  return outcome;
}

}  // namespace vimeo
