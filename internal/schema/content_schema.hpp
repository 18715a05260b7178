#pragma once

#include <string_view>

#include "signage/store/v1.hpp"

namespace signage::schema {

inline constexpr int              kDefaultFontSize     = 16;
inline constexpr int              kMinFontSize         = 8;
inline constexpr int              kMaxFontSize         = 200;
inline constexpr int              kDefaultScrollSpeed  = 3;
inline constexpr int              kMinScrollSpeed      = 1;
inline constexpr int              kMaxScrollSpeed      = 10;
inline constexpr std::string_view kDefaultCsvRendererUrl = "https://csv-renderer.onrender.com";
inline constexpr std::string_view kDefaultWeatherApiUrl  = "https://jma-proxy.deno.dev";

/*
  Applies defaults then validates a content record. Returns the
  normalized record; throws util::ValidationError naming the field.

  The type tag selects the one payload that must be populated:
    video, image → fileInfo
    text         → textInfo
    csv          → csvInfo
    weather      → weatherInfo
    url, youtube → urlInfo
*/
signage::store::v1::ContentItem ValidateContent(const signage::store::v1::ContentItem& raw);

signage::store::v1::ContentIndexEntry ValidateContentIndexEntry(const signage::store::v1::ContentIndexEntry& raw);

signage::store::v1::ContentIndexEntry ToContentIndexEntry(const signage::store::v1::ContentItem& item);

signage::store::v1::ContentItem::PayloadCase PayloadFor(signage::store::v1::ContentType type);

bool IsYouTubeUrl(std::string_view url);

} // namespace signage::schema
