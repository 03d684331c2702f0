#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vimeo {

enum class EmbedTitleMode { User, Show, Hide };

enum class VideoLicense { By, BySa, ByNd, ByNc, ByNcSa, ByNcNd, Cc0 };

enum class PrivacyComments { Anybody, Nobody, Contacts };

enum class PrivacyEmbed { Public, Private, Whitelist };

enum class PrivacyView { Anybody, Nobody, Contacts, Password, Users, Unlisted, Disable };

enum class MpaaRating { G, PG, PG13, R, NC17, X };

enum class MpaaReason { At, N, Bn, Ss, Sl, V };

enum class TvRating { Y, Y7, Y7Fv, G, PG, T14, MA };

enum class TvReason { D, Fv, L, Ss, V };

enum class SpatialProjection { Dome, Cubical, Cylindrical, Equirectangular, Pyramid };

enum class SpatialStereoFormat { LeftRight, Mono, TopBottom };

std::string to_string(EmbedTitleMode value);
std::string to_string(VideoLicense value);
std::string to_string(PrivacyComments value);
std::string to_string(PrivacyEmbed value);
std::string to_string(PrivacyView value);
std::string to_string(MpaaRating value);
std::string to_string(MpaaReason value);
std::string to_string(TvRating value);
std::string to_string(TvReason value);
std::string to_string(SpatialProjection value);
std::string to_string(SpatialStereoFormat value);

/** Parses the wire name of a privacy.view value ("anybody", "unlisted", ...). */
std::optional<PrivacyView> parse_privacy_view(const std::string& value);

/**
 * Settable properties of a video. Every field is optional; only fields that
 * hold a value are sent, each under its dotted wire key (e.g.
 * `embed_buttons_like` -> "embed.buttons.like").
 */
struct VideoProperties {
  std::optional<std::string> content_rating;
  std::optional<std::string> description;
  std::optional<bool> embed_buttons_embed;
  std::optional<bool> embed_buttons_fullscreen;
  std::optional<bool> embed_buttons_hd;
  std::optional<bool> embed_buttons_like;
  std::optional<bool> embed_buttons_scaling;
  std::optional<bool> embed_buttons_share;
  std::optional<bool> embed_buttons_watchlater;
  std::optional<std::string> embed_color;
  std::optional<bool> embed_logos_custom_active;
  std::optional<std::string> embed_logos_custom_link;
  std::optional<bool> embed_logos_custom_sticky;
  std::optional<bool> embed_logos_vimeo;
  std::optional<bool> embed_playbar;
  std::optional<EmbedTitleMode> embed_title_name;
  std::optional<EmbedTitleMode> embed_title_owner;
  std::optional<EmbedTitleMode> embed_title_portrait;
  std::optional<bool> embed_volume;
  std::optional<std::string> external_links_imdb;
  std::optional<std::string> external_links_rotten_tomatoes;
  std::optional<VideoLicense> license;
  std::optional<std::string> locale;
  std::optional<std::string> name;
  // Required by the API when privacy_view is PrivacyView::Password.
  std::optional<std::string> password;
  std::optional<bool> privacy_add;
  std::optional<PrivacyComments> privacy_comments;
  std::optional<bool> privacy_download;
  std::optional<PrivacyEmbed> privacy_embed;
  std::optional<PrivacyView> privacy_view;
  std::optional<MpaaRating> ratings_mpaa_rating;
  std::optional<MpaaReason> ratings_mpaa_reason;
  std::optional<TvRating> ratings_tv_rating;
  std::optional<TvReason> ratings_tv_reason;
  std::optional<bool> review_link;
  std::optional<std::string> spatial_director_timeline;
  std::optional<std::string> spatial_field_of_view;
  std::optional<SpatialProjection> spatial_projection;
  std::optional<SpatialStereoFormat> spatial_stereo_format;
};

/** Flat JSON object of dotted keys; unset fields are omitted. */
nlohmann::json video_properties_to_json(const VideoProperties& properties);

}  // namespace vimeo
