#include "vimeo/videos.hpp"

#include "vimeo/client.hpp"
#include "vimeo/error.hpp"
#include "vimeo/pagination.hpp"
#include "vimeo/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>

namespace vimeo {
namespace {

using json = nlohmann::json;

constexpr const char* kMyVideosPath = "/me/videos";
constexpr const char* kVideosPath = "/videos";

bool has_object(const json& payload, const char* key) {
  return payload.contains(key) && payload.at(key).is_object();
}

bool has_array(const json& payload, const char* key) {
  return payload.contains(key) && payload.at(key).is_array();
}

std::int64_t int_or_zero(const json& payload, const char* key) {
  if (!payload.contains(key)) {
    return 0;
  }
  return utils::maybe_coerce_integer(payload.at(key)).value_or(0);
}

bool bool_or_false(const json& payload, const char* key) {
  return payload.contains(key) && payload.at(key).is_boolean() && payload.at(key).get<bool>();
}

std::string string_or_empty(const json& payload, const char* key) {
  return utils::optional_string(payload, key).value_or("");
}

VideoEmbed parse_embed(const json& payload) {
  VideoEmbed embed;
  embed.uri = utils::optional_string(payload, "uri");
  embed.html = utils::optional_string(payload, "html");
  if (has_object(payload, "buttons")) {
    const auto& buttons = payload.at("buttons");
    embed.buttons.like = bool_or_false(buttons, "like");
    embed.buttons.watchlater = bool_or_false(buttons, "watchlater");
    embed.buttons.share = bool_or_false(buttons, "share");
    embed.buttons.embed = bool_or_false(buttons, "embed");
    embed.buttons.hd = bool_or_false(buttons, "hd");
    embed.buttons.fullscreen = bool_or_false(buttons, "fullscreen");
    embed.buttons.scaling = bool_or_false(buttons, "scaling");
  }
  if (has_object(payload, "logos")) {
    const auto& logos = payload.at("logos");
    embed.logos.vimeo = bool_or_false(logos, "vimeo");
    if (has_object(logos, "custom")) {
      const auto& custom = logos.at("custom");
      embed.logos.custom.active = bool_or_false(custom, "active");
      embed.logos.custom.link = utils::optional_string(custom, "link");
      embed.logos.custom.sticky = bool_or_false(custom, "sticky");
    }
  }
  if (has_object(payload, "title")) {
    const auto& title = payload.at("title");
    embed.title.name = string_or_empty(title, "name");
    embed.title.owner = string_or_empty(title, "owner");
    embed.title.portrait = string_or_empty(title, "portrait");
  }
  embed.playbar = bool_or_false(payload, "playbar");
  embed.volume = bool_or_false(payload, "volume");
  embed.color = string_or_empty(payload, "color");
  return embed;
}

VideoPrivacy parse_privacy(const json& payload) {
  VideoPrivacy privacy;
  privacy.view = string_or_empty(payload, "view");
  privacy.embed = string_or_empty(payload, "embed");
  privacy.download = bool_or_false(payload, "download");
  privacy.add = bool_or_false(payload, "add");
  privacy.comments = string_or_empty(payload, "comments");
  return privacy;
}

VideoPictures parse_pictures(const json& payload) {
  VideoPictures pictures;
  pictures.uri = string_or_empty(payload, "uri");
  pictures.active = bool_or_false(payload, "active");
  pictures.type = string_or_empty(payload, "type");
  pictures.resource_key = string_or_empty(payload, "resource_key");
  if (has_array(payload, "sizes")) {
    for (const auto& item : payload.at("sizes")) {
      if (!item.is_object()) {
        continue;
      }
      VideoPictureSize size;
      size.width = int_or_zero(item, "width");
      size.height = int_or_zero(item, "height");
      size.link = string_or_empty(item, "link");
      size.link_with_play_button = utils::optional_string(item, "link_with_play_button");
      pictures.sizes.push_back(std::move(size));
    }
  }
  return pictures;
}

std::optional<VideoConnection> parse_connection(const json& connections, const char* key) {
  if (!has_object(connections, key)) {
    return std::nullopt;
  }
  const auto& payload = connections.at(key);
  VideoConnection connection;
  connection.uri = string_or_empty(payload, "uri");
  connection.total = int_or_zero(payload, "total");
  if (has_array(payload, "options")) {
    for (const auto& option : payload.at("options")) {
      if (option.is_string()) {
        connection.options.push_back(option.get<std::string>());
      }
    }
  }
  return connection;
}

VideoMetadata parse_metadata(const json& payload) {
  VideoMetadata metadata;
  if (has_object(payload, "connections")) {
    const auto& connections = payload.at("connections");
    metadata.comments = parse_connection(connections, "comments");
    metadata.credits = parse_connection(connections, "credits");
    metadata.likes = parse_connection(connections, "likes");
    metadata.pictures = parse_connection(connections, "pictures");
    metadata.texttracks = parse_connection(connections, "texttracks");
    metadata.related = parse_connection(connections, "related");
  }
  if (has_object(payload, "interactions") && has_object(payload.at("interactions"), "watchlater")) {
    const auto& watchlater = payload.at("interactions").at("watchlater");
    VideoWatchLater interaction;
    interaction.added = bool_or_false(watchlater, "added");
    interaction.added_time = utils::optional_string(watchlater, "added_time");
    interaction.uri = string_or_empty(watchlater, "uri");
    metadata.watchlater = std::move(interaction);
  }
  return metadata;
}

// Tags arrive as objects ({"tag": "...", "name": "..."}); older payloads use plain strings.
std::vector<std::string> parse_tags(const json& payload) {
  std::vector<std::string> tags;
  for (const auto& item : payload) {
    if (item.is_string()) {
      tags.push_back(item.get<std::string>());
    } else if (item.is_object()) {
      auto tag = utils::optional_string(item, "tag");
      if (!tag) {
        tag = utils::optional_string(item, "name");
      }
      if (tag) {
        tags.push_back(std::move(*tag));
      }
    }
  }
  return tags;
}

PagingLinks parse_paging(const json& payload) {
  PagingLinks paging;
  if (!payload.is_object()) {
    return paging;
  }
  paging.next = utils::optional_string(payload, "next");
  paging.previous = utils::optional_string(payload, "previous");
  paging.first = utils::optional_string(payload, "first");
  paging.last = utils::optional_string(payload, "last");
  return paging;
}

std::string video_target(const std::string& video) {
  if (utils::is_absolute_url(video) || (!video.empty() && video.front() == '/')) {
    return video;
  }
  return std::string(kVideosPath) + "/" + video;
}

json parse_body(const HttpResponse& response, const char* what) {
  try {
    return json::parse(response.body);
  } catch (const json::exception& ex) {
    throw VimeoError(std::string("Failed to parse ") + what + " response: " + ex.what());
  }
}

}  // namespace

std::string Video::video_id() const {
  return utils::last_path_segment(uri);
}

Video parse_video(const json& payload) {
  if (!payload.is_object()) {
    throw VimeoError("Video payload must be a JSON object");
  }
  Video video;
  video.raw = payload;
  video.uri = string_or_empty(payload, "uri");
  video.name = string_or_empty(payload, "name");
  video.description = utils::optional_string(payload, "description");
  video.link = string_or_empty(payload, "link");
  video.duration = int_or_zero(payload, "duration");
  video.width = int_or_zero(payload, "width");
  video.height = int_or_zero(payload, "height");
  video.language = utils::optional_string(payload, "language");
  if (has_object(payload, "embed")) {
    video.embed = parse_embed(payload.at("embed"));
  }
  video.created_time = string_or_empty(payload, "created_time");
  video.modified_time = string_or_empty(payload, "modified_time");
  video.release_time = string_or_empty(payload, "release_time");
  if (has_array(payload, "content_rating")) {
    for (const auto& rating : payload.at("content_rating")) {
      if (rating.is_string()) {
        video.content_rating.push_back(rating.get<std::string>());
      }
    }
  }
  video.license = utils::optional_string(payload, "license");
  if (has_object(payload, "privacy")) {
    video.privacy = parse_privacy(payload.at("privacy"));
  }
  if (has_object(payload, "pictures")) {
    video.pictures = parse_pictures(payload.at("pictures"));
  }
  if (has_array(payload, "tags")) {
    video.tags = parse_tags(payload.at("tags"));
  }
  if (has_object(payload, "stats")) {
    video.plays = int_or_zero(payload.at("stats"), "plays");
  }
  if (has_object(payload, "metadata")) {
    video.metadata = parse_metadata(payload.at("metadata"));
  }
  if (payload.contains("user")) {
    video.user = payload.at("user");
  }
  video.status = string_or_empty(payload, "status");
  video.resource_key = string_or_empty(payload, "resource_key");
  if (payload.contains("embed_presets")) {
    video.embed_presets = payload.at("embed_presets");
  }
  return video;
}

Video VideosResource::retrieve(const std::string& video_id) const {
  return retrieve(video_id, RequestOptions{});
}

Video VideosResource::retrieve(const std::string& video_id, const RequestOptions& options) const {
  if (video_id.empty()) {
    throw VimeoError("video_id must not be empty");
  }
  auto path = std::string(kMyVideosPath) + "/" + video_id;
  auto response = client_.request("GET", path, "", options);
  return parse_video(parse_body(response, "video retrieve"));
}

std::vector<Video> VideosResource::list(const std::optional<std::string>& query) const {
  return list(query, RequestOptions{});
}

std::vector<Video> VideosResource::list(const std::optional<std::string>& query, const RequestOptions& options) const {
  VideoListParams params;
  params.query = query;
  return list_page(params, options).collect_all();
}

VideoPage VideosResource::list_page(const VideoListParams& params) const {
  return list_page(params, RequestOptions{});
}

VideoPage VideosResource::list_page(const VideoListParams& params, const RequestOptions& options) const {
  utils::validate_positive_integer("VideoListParams.per_page", params.per_page);

  RequestOptions request_options = options;
  request_options.query_params.emplace_back("direction", params.direction);
  request_options.query_params.emplace_back("per_page", std::to_string(params.per_page));
  request_options.query_params.emplace_back("sort", params.sort);
  if (params.page) {
    request_options.query_params.emplace_back("page", std::to_string(*params.page));
  }
  if (params.query) {
    request_options.query_params.emplace_back("query", *params.query);
  }
  return fetch_page(kMyVideosPath, request_options);
}

VideoPage VideosResource::fetch_page(const std::string& link, const RequestOptions& options) const {
  auto response = client_.request("GET", link, "", options);
  auto payload = parse_body(response, "video list");
  if (!payload.is_object()) {
    throw VimeoError("Video list payload must be a JSON object");
  }

  std::vector<Video> videos;
  if (has_array(payload, "data")) {
    for (const auto& item : payload.at("data")) {
      videos.push_back(parse_video(item));
    }
  }

  std::int64_t total = payload.contains("total") ? utils::coerce_integer(payload.at("total")) : 0;
  std::int64_t page = payload.contains("page") ? utils::coerce_integer(payload.at("page")) : 0;
  std::int64_t per_page = payload.contains("per_page") ? utils::coerce_integer(payload.at("per_page")) : 0;
  PagingLinks paging = payload.contains("paging") ? parse_paging(payload.at("paging")) : PagingLinks{};

  // `next` links already carry the full query string.
  RequestOptions next_options = options;
  next_options.query_params.clear();

  return VideoPage(std::move(videos),
                   total,
                   page,
                   per_page,
                   std::move(paging),
                   [this, next_options](const std::string& next_link) { return fetch_page(next_link, next_options); },
                   std::move(payload));
}

Video VideosResource::update(const std::string& video, const VideoProperties& properties) const {
  return update(video, properties, RequestOptions{});
}

Video VideosResource::update(const std::string& video,
                             const VideoProperties& properties,
                             const RequestOptions& options) const {
  if (video.empty()) {
    throw VimeoError("video must not be empty");
  }
  const std::string target = video_target(video);
  auto response = client_.request("PATCH", target, video_properties_to_json(properties).dump(), options);
  if (!response.body.empty()) {
    return parse_video(parse_body(response, "video update"));
  }

  RequestOptions fetch_options = options;
  fetch_options.query_params.clear();
  auto refreshed = client_.request("GET", target, "", fetch_options);
  return parse_video(parse_body(refreshed, "video retrieve"));
}

}  // namespace vimeo
