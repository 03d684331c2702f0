#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vimeo/pagination.hpp"
#include "vimeo/video_properties.hpp"

namespace vimeo {

struct RequestOptions;
class VimeoClient;

struct VideoEmbedButtons {
  bool like = false;
  bool watchlater = false;
  bool share = false;
  bool embed = false;
  bool hd = false;
  bool fullscreen = false;
  bool scaling = false;
};

struct VideoEmbedCustomLogo {
  bool active = false;
  std::optional<std::string> link;
  bool sticky = false;
};

struct VideoEmbedLogos {
  bool vimeo = false;
  VideoEmbedCustomLogo custom;
};

struct VideoEmbedTitle {
  std::string name;
  std::string owner;
  std::string portrait;
};

struct VideoEmbed {
  std::optional<std::string> uri;
  std::optional<std::string> html;
  VideoEmbedButtons buttons;
  VideoEmbedLogos logos;
  VideoEmbedTitle title;
  bool playbar = false;
  bool volume = false;
  std::string color;
};

struct VideoPrivacy {
  std::string view;
  std::string embed;
  bool download = false;
  bool add = false;
  std::string comments;
};

struct VideoPictureSize {
  std::int64_t width = 0;
  std::int64_t height = 0;
  std::string link;
  std::optional<std::string> link_with_play_button;
};

struct VideoPictures {
  std::string uri;
  bool active = false;
  std::string type;
  std::vector<VideoPictureSize> sizes;
  std::string resource_key;
};

struct VideoConnection {
  std::string uri;
  std::vector<std::string> options;
  std::int64_t total = 0;
};

struct VideoWatchLater {
  bool added = false;
  std::optional<std::string> added_time;
  std::string uri;
};

struct VideoMetadata {
  std::optional<VideoConnection> comments;
  std::optional<VideoConnection> credits;
  std::optional<VideoConnection> likes;
  std::optional<VideoConnection> pictures;
  std::optional<VideoConnection> texttracks;
  std::optional<VideoConnection> related;
  std::optional<VideoWatchLater> watchlater;
};

struct Video {
  std::string uri;
  std::string name;
  std::optional<std::string> description;
  std::string link;
  std::int64_t duration = 0;
  std::int64_t width = 0;
  std::int64_t height = 0;
  std::optional<std::string> language;
  VideoEmbed embed;
  std::string created_time;
  std::string modified_time;
  std::string release_time;
  std::vector<std::string> content_rating;
  std::optional<std::string> license;
  VideoPrivacy privacy;
  std::optional<VideoPictures> pictures;
  std::vector<std::string> tags;
  std::int64_t plays = 0;
  VideoMetadata metadata;
  nlohmann::json user = nullptr;
  std::string status;
  std::string resource_key;
  nlohmann::json embed_presets = nullptr;
  nlohmann::json raw = nlohmann::json::object();

  /** Numeric id taken from the trailing segment of `uri`. */
  std::string video_id() const;
};

using VideoPage = LinkPage<Video>;

struct VideoListParams {
  std::optional<std::string> query;
  int per_page = 100;
  std::string sort = "date";
  std::string direction = "desc";
  std::optional<int> page;
};

Video parse_video(const nlohmann::json& payload);

class VideosResource {
public:
  explicit VideosResource(VimeoClient& client) : client_(client) {}

  /** GET /me/videos/{id}. Throws on transport, status or decode failure. */
  Video retrieve(const std::string& video_id) const;
  Video retrieve(const std::string& video_id, const RequestOptions& options) const;

  /**
   * Lists every video of the authenticated user, newest first, following
   * `paging.next` until the last page.
   */
  std::vector<Video> list(const std::optional<std::string>& query = std::nullopt) const;
  std::vector<Video> list(const std::optional<std::string>& query, const RequestOptions& options) const;

  VideoPage list_page(const VideoListParams& params) const;
  VideoPage list_page(const VideoListParams& params, const RequestOptions& options) const;

  /**
   * PATCHes properties onto a video addressed by id, API path or absolute
   * URI. Returns the updated video.
   */
  Video update(const std::string& video, const VideoProperties& properties) const;
  Video update(const std::string& video, const VideoProperties& properties, const RequestOptions& options) const;

private:
  VideoPage fetch_page(const std::string& link, const RequestOptions& options) const;

  VimeoClient& client_;
};

}  // namespace vimeo
