#include "vimeo/video_properties.hpp"

#include <type_traits>

namespace vimeo {
namespace {

using json = nlohmann::json;

template <typename T>
void set_if(json& body, const char* key, const std::optional<T>& value) {
  if (!value) {
    return;
  }
  if constexpr (std::is_enum_v<T>) {
    body[key] = to_string(*value);
  } else {
    body[key] = *value;
  }
}

}  // namespace

std::string to_string(EmbedTitleMode value) {
  switch (value) {
    case EmbedTitleMode::User:
      return "user";
    case EmbedTitleMode::Show:
      return "show";
    case EmbedTitleMode::Hide:
      return "hide";
  }
  return "user";
}

std::string to_string(VideoLicense value) {
  switch (value) {
    case VideoLicense::By:
      return "by";
    case VideoLicense::BySa:
      return "by-sa";
    case VideoLicense::ByNd:
      return "by-nd";
    case VideoLicense::ByNc:
      return "by-nc";
    case VideoLicense::ByNcSa:
      return "by-nc-sa";
    case VideoLicense::ByNcNd:
      return "by-nc-nd";
    case VideoLicense::Cc0:
      return "cc0";
  }
  return "by";
}

std::string to_string(PrivacyComments value) {
  switch (value) {
    case PrivacyComments::Anybody:
      return "anybody";
    case PrivacyComments::Nobody:
      return "nobody";
    case PrivacyComments::Contacts:
      return "contacts";
  }
  return "anybody";
}

std::string to_string(PrivacyEmbed value) {
  switch (value) {
    case PrivacyEmbed::Public:
      return "public";
    case PrivacyEmbed::Private:
      return "private";
    case PrivacyEmbed::Whitelist:
      return "whitelist";
  }
  return "public";
}

std::string to_string(PrivacyView value) {
  switch (value) {
    case PrivacyView::Anybody:
      return "anybody";
    case PrivacyView::Nobody:
      return "nobody";
    case PrivacyView::Contacts:
      return "contacts";
    case PrivacyView::Password:
      return "password";
    case PrivacyView::Users:
      return "users";
    case PrivacyView::Unlisted:
      return "unlisted";
    case PrivacyView::Disable:
      return "disable";
  }
  return "anybody";
}

std::string to_string(MpaaRating value) {
  switch (value) {
    case MpaaRating::G:
      return "g";
    case MpaaRating::PG:
      return "pg";
    case MpaaRating::PG13:
      return "pg13";
    case MpaaRating::R:
      return "r";
    case MpaaRating::NC17:
      return "nc17";
    case MpaaRating::X:
      return "x";
  }
  return "g";
}

std::string to_string(MpaaReason value) {
  switch (value) {
    case MpaaReason::At:
      return "at";
    case MpaaReason::N:
      return "n";
    case MpaaReason::Bn:
      return "bn";
    case MpaaReason::Ss:
      return "ss";
    case MpaaReason::Sl:
      return "sl";
    case MpaaReason::V:
      return "v";
  }
  return "at";
}

std::string to_string(TvRating value) {
  switch (value) {
    case TvRating::Y:
      return "tv-y";
    case TvRating::Y7:
      return "tv-y7";
    case TvRating::Y7Fv:
      return "tv-y7-fv";
    case TvRating::G:
      return "tv-g";
    case TvRating::PG:
      return "tv-pg";
    case TvRating::T14:
      return "tv-14";
    case TvRating::MA:
      return "tv-ma";
  }
  return "tv-g";
}

std::string to_string(TvReason value) {
  switch (value) {
    case TvReason::D:
      return "d";
    case TvReason::Fv:
      return "fv";
    case TvReason::L:
      return "l";
    case TvReason::Ss:
      return "ss";
    case TvReason::V:
      return "v";
  }
  return "d";
}

std::string to_string(SpatialProjection value) {
  switch (value) {
    case SpatialProjection::Dome:
      return "dome";
    case SpatialProjection::Cubical:
      return "cubical";
    case SpatialProjection::Cylindrical:
      return "cylindrical";
    case SpatialProjection::Equirectangular:
      return "equirectangular";
    case SpatialProjection::Pyramid:
      return "pyramid";
  }
  return "equirectangular";
}

std::string to_string(SpatialStereoFormat value) {
  switch (value) {
    case SpatialStereoFormat::LeftRight:
      return "left-right";
    case SpatialStereoFormat::Mono:
      return "mono";
    case SpatialStereoFormat::TopBottom:
      return "top-bottom";
  }
  return "mono";
}

std::optional<PrivacyView> parse_privacy_view(const std::string& value) {
  for (auto candidate : {PrivacyView::Anybody, PrivacyView::Nobody, PrivacyView::Contacts, PrivacyView::Password,
                         PrivacyView::Users, PrivacyView::Unlisted, PrivacyView::Disable}) {
    if (to_string(candidate) == value) {
      return candidate;
    }
  }
  return std::nullopt;
}

json video_properties_to_json(const VideoProperties& properties) {
  json body = json::object();
  set_if(body, "content_rating", properties.content_rating);
  set_if(body, "description", properties.description);
  set_if(body, "embed.buttons.embed", properties.embed_buttons_embed);
  set_if(body, "embed.buttons.fullscreen", properties.embed_buttons_fullscreen);
  set_if(body, "embed.buttons.hd", properties.embed_buttons_hd);
  set_if(body, "embed.buttons.like", properties.embed_buttons_like);
  set_if(body, "embed.buttons.scaling", properties.embed_buttons_scaling);
  set_if(body, "embed.buttons.share", properties.embed_buttons_share);
  set_if(body, "embed.buttons.watchlater", properties.embed_buttons_watchlater);
  set_if(body, "embed.color", properties.embed_color);
  set_if(body, "embed.logos.custom.active", properties.embed_logos_custom_active);
  set_if(body, "embed.logos.custom.link", properties.embed_logos_custom_link);
  set_if(body, "embed.logos.custom.sticky", properties.embed_logos_custom_sticky);
  set_if(body, "embed.logos.vimeo", properties.embed_logos_vimeo);
  set_if(body, "embed.playbar", properties.embed_playbar);
  set_if(body, "embed.title.name", properties.embed_title_name);
  set_if(body, "embed.title.owner", properties.embed_title_owner);
  set_if(body, "embed.title.portrait", properties.embed_title_portrait);
  set_if(body, "embed.volume", properties.embed_volume);
  set_if(body, "external_links.imdb", properties.external_links_imdb);
  set_if(body, "external_links.rotten_tomatoes", properties.external_links_rotten_tomatoes);
  set_if(body, "license", properties.license);
  set_if(body, "locale", properties.locale);
  set_if(body, "name", properties.name);
  set_if(body, "password", properties.password);
  set_if(body, "privacy.add", properties.privacy_add);
  set_if(body, "privacy.comments", properties.privacy_comments);
  set_if(body, "privacy.download", properties.privacy_download);
  set_if(body, "privacy.embed", properties.privacy_embed);
  set_if(body, "privacy.view", properties.privacy_view);
  set_if(body, "ratings.mpaa.rating", properties.ratings_mpaa_rating);
  set_if(body, "ratings.mpaa.reason", properties.ratings_mpaa_reason);
  set_if(body, "ratings.tv.rating", properties.ratings_tv_rating);
  set_if(body, "ratings.tv.reason", properties.ratings_tv_reason);
  set_if(body, "review_link", properties.review_link);
  set_if(body, "spatial.director_timeline", properties.spatial_director_timeline);
  set_if(body, "spatial.field_of_view", properties.spatial_field_of_view);
  set_if(body, "spatial.projection", properties.spatial_projection);
  set_if(body, "spatial.stereo_format", properties.spatial_stereo_format);
  return body;
}

}  // namespace vimeo
