#include "content_schema.hpp"

#include <string>

#include "internal/schema/schema_common.hpp"

namespace signage::schema {

using namespace signage::store::v1;

namespace {

bool IsWordChar(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}

std::string PayloadFieldName(ContentItem::PayloadCase payload) {
  switch (payload) {
    case ContentItem::kFileInfo:
      return "fileInfo";
    case ContentItem::kUrlInfo:
      return "urlInfo";
    case ContentItem::kTextInfo:
      return "textInfo";
    case ContentItem::kWeatherInfo:
      return "weatherInfo";
    case ContentItem::kCsvInfo:
      return "csvInfo";
    case ContentItem::PAYLOAD_NOT_SET:
      break;
  }
  return "payload";
}

void ValidateFileInfo(ContentType type, FileInfo* info) {
  RequireNonEmpty(info->original_name(), "fileInfo.originalName");
  RequireNonEmpty(info->mime_type(), "fileInfo.mimeType");
  RequireNonEmpty(info->storage_path(), "fileInfo.storagePath");

  const auto prefix = type == CONTENT_TYPE_VIDEO ? "video/" : "image/";
  Require(StartsWith(info->mime_type(), prefix), "fileInfo.mimeType", "must start with " + std::string(prefix) + " for " + ContentType_Name(type));

  if (info->has_metadata()) {
    const auto& metadata = info->metadata();
    Require(!metadata.has_width() || metadata.width() >= 1, "fileInfo.metadata.width", "must be at least 1");
    Require(!metadata.has_height() || metadata.height() >= 1, "fileInfo.metadata.height", "must be at least 1");
    Require(!metadata.has_duration() || metadata.duration() >= 0, "fileInfo.metadata.duration", "must not be negative");
  }
}

void ValidateUrlInfo(ContentType type, const UrlInfo& info) {
  Require(IsHttpUrl(info.url()), "urlInfo.url", "must be an absolute http(s) URL");
  if (type == CONTENT_TYPE_YOUTUBE) {
    Require(IsYouTubeUrl(info.url()), "urlInfo.url", "must be a YouTube video URL");
  }
}

void ValidateTextInfo(TextInfo* info) {
  if (!info->has_font_size()) info->set_font_size(kDefaultFontSize);
  if (!info->has_scroll_speed()) info->set_scroll_speed(kDefaultScrollSpeed);
  if (info->scroll_type() == SCROLL_TYPE_UNSPECIFIED) info->set_scroll_type(SCROLL_TYPE_NONE);

  RequireNonEmpty(info->content(), "textInfo.content");
  RequireNonEmpty(info->font_family(), "textInfo.fontFamily");
  Require(info->writing_mode() != WRITING_MODE_UNSPECIFIED, "textInfo.writingMode", "must be horizontal or vertical");
  Require(info->text_align() != TEXT_ALIGN_UNSPECIFIED, "textInfo.textAlign", "must be start, center or end");
  Require(IsHexColor(info->color()), "textInfo.color", "must be #RRGGBB");
  Require(IsHexColor(info->background_color()), "textInfo.backgroundColor", "must be #RRGGBB");
  Require(info->font_size() >= kMinFontSize && info->font_size() <= kMaxFontSize, "textInfo.fontSize",
          "must be between " + std::to_string(kMinFontSize) + " and " + std::to_string(kMaxFontSize));
  Require(info->scroll_speed() >= kMinScrollSpeed && info->scroll_speed() <= kMaxScrollSpeed, "textInfo.scrollSpeed",
          "must be between " + std::to_string(kMinScrollSpeed) + " and " + std::to_string(kMaxScrollSpeed));
}

void ValidateWeatherInfo(WeatherInfo* info) {
  if (info->api_url().empty()) info->set_api_url(std::string(kDefaultWeatherApiUrl));

  Require(info->locations_size() > 0, "weatherInfo.locations", "at least one location is required");
  NormalizeStringSet(info->mutable_locations(), "weatherInfo.locations");
  Require(info->weather_type() != WEATHER_TYPE_UNSPECIFIED, "weatherInfo.weatherType", "must be current or weekly");
  Require(IsHttpUrl(info->api_url()), "weatherInfo.apiUrl", "must be an absolute http(s) URL");
}

void ValidateCsvInfo(CsvInfo* info) {
  if (info->format() == IMAGE_FORMAT_UNSPECIFIED) info->set_format(IMAGE_FORMAT_PNG);
  if (info->api_url().empty()) info->set_api_url(std::string(kDefaultCsvRendererUrl));

  RequireNonEmpty(info->original_csv_data(), "csvInfo.originalCsvData");
  RequireNonEmpty(info->rendered_image_path(), "csvInfo.renderedImagePath");
  Require(IsHttpUrl(info->api_url()), "csvInfo.apiUrl", "must be an absolute http(s) URL");
  for (int i = 0; i < info->selected_rows_size(); ++i) {
    Require(info->selected_rows(i) >= 0, Indexed("csvInfo.selectedRows", i), "must not be negative");
  }
  for (int i = 0; i < info->selected_columns_size(); ++i) {
    Require(info->selected_columns(i) >= 0, Indexed("csvInfo.selectedColumns", i), "must not be negative");
  }
}

} // namespace

ContentItem::PayloadCase PayloadFor(ContentType type) {
  switch (type) {
    case CONTENT_TYPE_VIDEO:
    case CONTENT_TYPE_IMAGE:
      return ContentItem::kFileInfo;
    case CONTENT_TYPE_TEXT:
      return ContentItem::kTextInfo;
    case CONTENT_TYPE_CSV:
      return ContentItem::kCsvInfo;
    case CONTENT_TYPE_WEATHER:
      return ContentItem::kWeatherInfo;
    case CONTENT_TYPE_URL:
    case CONTENT_TYPE_YOUTUBE:
      return ContentItem::kUrlInfo;
    case CONTENT_TYPE_UNSPECIFIED:
      break;
    default:
      break;
  }
  Fail("type", "unknown content type");
}

/*
  ^(https?://)?(www\.)?(youtube\.com/watch\?v=|youtu\.be/)[\w-]+
*/
bool IsYouTubeUrl(std::string_view url) {
  if (StartsWith(url, "https://")) {
    url.remove_prefix(8);
  } else if (StartsWith(url, "http://")) {
    url.remove_prefix(7);
  }
  if (StartsWith(url, "www.")) {
    url.remove_prefix(4);
  }

  if (StartsWith(url, "youtube.com/watch?v=")) {
    url.remove_prefix(20);
  } else if (StartsWith(url, "youtu.be/")) {
    url.remove_prefix(9);
  } else {
    return false;
  }
  return !url.empty() && IsWordChar(url.front());
}

ContentItem ValidateContent(const ContentItem& raw) {
  ContentItem item = raw;

  RequireNonEmpty(item.id(), "id");
  RequireNonEmpty(item.name(), "name");
  NormalizeTimestamps(item.mutable_created_at(), item.mutable_updated_at());
  NormalizeStringSet(item.mutable_tags(), "tags");

  const auto expected = PayloadFor(item.type());
  if (item.payload_case() != expected) {
    Fail(PayloadFieldName(expected), "required for content type " + ContentType_Name(item.type()));
  }

  switch (item.payload_case()) {
    case ContentItem::kFileInfo:
      ValidateFileInfo(item.type(), item.mutable_file_info());
      break;
    case ContentItem::kUrlInfo:
      ValidateUrlInfo(item.type(), item.url_info());
      break;
    case ContentItem::kTextInfo:
      ValidateTextInfo(item.mutable_text_info());
      break;
    case ContentItem::kWeatherInfo:
      ValidateWeatherInfo(item.mutable_weather_info());
      break;
    case ContentItem::kCsvInfo:
      ValidateCsvInfo(item.mutable_csv_info());
      break;
    case ContentItem::PAYLOAD_NOT_SET:
      Fail("payload", "must be set");
  }

  return item;
}

ContentIndexEntry ValidateContentIndexEntry(const ContentIndexEntry& raw) {
  ContentIndexEntry entry = raw;
  RequireNonEmpty(entry.id(), "id");
  RequireNonEmpty(entry.name(), "name");
  (void)PayloadFor(entry.type());
  NormalizeTimestamps(entry.mutable_created_at(), entry.mutable_updated_at());
  return entry;
}

ContentIndexEntry ToContentIndexEntry(const ContentItem& item) {
  ContentIndexEntry entry;
  entry.set_id(item.id());
  entry.set_name(item.name());
  entry.set_type(item.type());
  if (item.has_file_info()) {
    entry.set_size(item.file_info().size());
  }
  if (item.has_url_info()) {
    entry.set_url(item.url_info().url());
  }
  *entry.mutable_tags()       = item.tags();
  *entry.mutable_created_at() = item.created_at();
  *entry.mutable_updated_at() = item.updated_at();
  return entry;
}

} // namespace signage::schema
