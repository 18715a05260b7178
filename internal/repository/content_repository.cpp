#include "content_repository.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace signage::repository {

using namespace signage::store::v1;
using signage::media::FileUpload;
using signage::storage::common::SanitizeFileName;

namespace {

constexpr std::array<const char*, 13> kTextExtensions = {".txt", ".md", ".markdown", ".json", ".xml", ".csv", ".log",
                                                          ".ini", ".cfg", ".conf",     ".yml",  ".yaml", ".toml"};

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StripExtension(const std::string& file_name) {
  auto dot = file_name.rfind('.');
  if (dot == std::string::npos || dot == 0) return file_name;
  return file_name.substr(0, dot);
}

std::optional<ContentType> FileContentType(const std::string& mime_type) {
  if (mime_type.rfind("video/", 0) == 0) return CONTENT_TYPE_VIDEO;
  if (mime_type.rfind("image/", 0) == 0) return CONTENT_TYPE_IMAGE;
  return std::nullopt;
}

void SetTags(ContentItem* item, const std::vector<std::string>& tags) {
  item->clear_tags();
  for (const auto& tag : tags) {
    item->add_tags(tag);
  }
}

const char* Extension(ImageFormat format) {
  switch (format) {
    case IMAGE_FORMAT_JPEG:
      return "jpg";
    case IMAGE_FORMAT_PNG:
    case IMAGE_FORMAT_UNSPECIFIED:
    default:
      return "png";
  }
}

} // namespace

ContentRepository::ContentRepository(storage::VirtualStorePtr store, lock::ResourceLockManagerPtr locks, media::ThumbnailGeneratorPtr thumbnails,
                                     media::CsvRendererPtr csv_renderer)
    : IndexedRepository(std::move(store), std::move(locks)), thumbnails_(std::move(thumbnails)), csv_renderer_(std::move(csv_renderer)) {
}

// ------------------------------------------------------------------
// Paths
// ------------------------------------------------------------------

std::string ContentRepository::FilePath(const std::string& id, const std::string& file_name) {
  return std::string(ContentTraits::kDirectory) + "/files/" + id + "-" + SanitizeFileName(file_name);
}

std::string ContentRepository::ThumbnailPath(const std::string& id) {
  return std::string(ContentTraits::kDirectory) + "/thumbnails/" + id + ".jpg";
}

std::string ContentRepository::CsvAssetDir(const std::string& id) {
  return std::string(ContentTraits::kDirectory) + "/csv-" + id;
}

bool ContentRepository::IsTextFile(const FileUpload& file) {
  if (file.mime_type.rfind("text/", 0) == 0) {
    return true;
  }
  const auto name = Lowercase(file.name);
  return std::any_of(kTextExtensions.begin(), kTextExtensions.end(), [&](const char* ext) { return EndsWith(name, ext); });
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

ContentItem ContentRepository::CreateFileContent(const FileUpload& file, const std::string& name, const std::vector<std::string>& tags) {
  auto type = FileContentType(file.mime_type);
  if (!type) {
    throw util::ValidationError("fileInfo.mimeType", "unsupported file type " + file.mime_type);
  }
  if (!file.data) {
    throw util::ValidationError("file", "no data");
  }

  return locks_->WithLock(CreateLockKey(), [&] {
    ContentItem item;
    AssignNewIdentity(&item);
    item.set_name(name.empty() ? file.name : name);
    item.set_type(*type);
    SetTags(&item, tags);

    auto* info = item.mutable_file_info();
    info->set_original_name(file.name);
    info->set_size(file.size());
    info->set_mime_type(file.mime_type);
    info->set_storage_path(FilePath(item.id(), file.name));

    std::vector<std::string> written;
    try {
      store_->WriteBytes(info->storage_path(), file.data);
      written.push_back(info->storage_path());

      if (AttachThumbnail(item.id(), file, info)) {
        written.push_back(info->thumbnail_path());
      }
      return InsertLocked(std::move(item));
    } catch (const std::exception&) {
      RemovePaths(written);
      throw;
    }
  });
}

ContentItem ContentRepository::CreateFileOrTextContent(const FileUpload& file, const std::string& name, const std::vector<std::string>& tags) {
  if (!IsTextFile(file)) {
    return CreateFileContent(file, name, tags);
  }

  TextInfo text;
  text.set_content(file.data ? file.data->ToString() : std::string{});
  text.set_writing_mode(WRITING_MODE_HORIZONTAL);
  text.set_font_family("Noto Sans JP");
  text.set_text_align(TEXT_ALIGN_START);
  text.set_color("#000000");
  text.set_background_color("#ffffff");
  text.set_font_size(24);
  text.set_scroll_type(SCROLL_TYPE_NONE);
  text.set_scroll_speed(schema::kDefaultScrollSpeed);

  return CreateTextContent(name.empty() ? StripExtension(file.name) : name, text, tags);
}

ContentItem ContentRepository::CreateUrlContent(const std::string& url, const std::string& name, const std::string& title,
                                                const std::string& description, const std::vector<std::string>& tags) {
  return locks_->WithLock(CreateLockKey(), [&] {
    ContentItem item;
    AssignNewIdentity(&item);
    item.set_name(!name.empty() ? name : (!title.empty() ? title : url));
    item.set_type(schema::IsYouTubeUrl(url) ? CONTENT_TYPE_YOUTUBE : CONTENT_TYPE_URL);
    SetTags(&item, tags);

    auto* info = item.mutable_url_info();
    info->set_url(url);
    info->set_title(title);
    info->set_description(description);
    return InsertLocked(std::move(item));
  });
}

ContentItem ContentRepository::CreateTextContent(const std::string& name, const TextInfo& text, const std::vector<std::string>& tags) {
  return locks_->WithLock(CreateLockKey(), [&] {
    ContentItem item;
    AssignNewIdentity(&item);
    item.set_name(name);
    item.set_type(CONTENT_TYPE_TEXT);
    SetTags(&item, tags);
    *item.mutable_text_info() = text;
    return InsertLocked(std::move(item));
  });
}

ContentItem ContentRepository::CreateWeatherContent(const std::string& name, const WeatherInfo& weather, const std::vector<std::string>& tags) {
  return locks_->WithLock(CreateLockKey(), [&] {
    ContentItem item;
    AssignNewIdentity(&item);
    item.set_name(name);
    item.set_type(CONTENT_TYPE_WEATHER);
    SetTags(&item, tags);
    *item.mutable_weather_info() = weather;
    return InsertLocked(std::move(item));
  });
}

/*
  contents/csv-<id>/original-<name>    uploaded CSV (optional)
  contents/csv-<id>/background-<name>  background image (optional)
  contents/csv-<id>/rendered-<ms>.png  rendered image

  A name already taken gets a counter: original-1-<name>, rendered-<ms>-1.png.
*/
ContentItem ContentRepository::CreateCsvContent(const CsvContentRequest& request) {
  if (request.csv.original_csv_data().empty()) {
    throw util::ValidationError("csvInfo.originalCsvData", "must not be empty");
  }

  return locks_->WithLock(CreateLockKey(), [&] {
    ContentItem item;
    AssignNewIdentity(&item);
    item.set_name(request.name);
    item.set_type(CONTENT_TYPE_CSV);
    SetTags(&item, request.tags);

    auto* csv = item.mutable_csv_info();
    *csv      = request.csv;
    csv->clear_original_csv_file_path();
    csv->clear_background_path();
    csv->clear_rendered_image_path();

    try {
      if (request.csv_file) {
        csv->set_original_csv_file_path(StoreCsvAsset(item.id(), "original-", *request.csv_file));
        csv->set_original_csv_file_name(request.csv_file->name);
      }

      std::shared_ptr<arrow::Buffer> background;
      if (request.background) {
        csv->set_background_path(StoreCsvAsset(item.id(), "background-", *request.background));
        csv->set_background_file_name(request.background->name);
        background = request.background->data;
      }

      csv->set_rendered_image_path(RenderCsv(item.id(), *csv, background));
      return InsertLocked(std::move(item));
    } catch (const std::exception&) {
      RemoveCsvDir(item.id());
      throw;
    }
  });
}

// ------------------------------------------------------------------
// Update
// ------------------------------------------------------------------

ContentItem ContentRepository::UpdateContent(const std::string& id, const ContentItem& patch, const google::protobuf::FieldMask& mask,
                                             const CsvAssetUpdate& csv) {
  const bool touches_csv = csv.regenerate_image || csv.csv_file || csv.background;
  if (!touches_csv) {
    return Update(id, patch, mask);
  }

  ValidateId(id);
  return locks_->WithLock(EntityLockKey(id), [&] {
    auto current = ReadDetailLocked(id);
    if (!current) {
      throw util::NotFound("content not found: " + id);
    }
    if (current->type() != CONTENT_TYPE_CSV) {
      throw util::ValidationError("csvInfo", "content " + id + " is not CSV content");
    }

    ContentItem next = mask.paths_size() > 0 ? MergePatch(*current, patch, mask) : *current;
    if (!next.has_csv_info()) {
      throw util::ValidationError("csvInfo", "required for content type CONTENT_TYPE_CSV");
    }
    auto*       info   = next.mutable_csv_info();
    const auto& before = current->csv_info();

    // asset writes never reuse an existing path, so each one is new here
    std::vector<std::string> written;
    try {
      if (csv.csv_file) {
        info->set_original_csv_file_path(StoreCsvAsset(id, "original-", *csv.csv_file));
        info->set_original_csv_file_name(csv.csv_file->name);
        written.push_back(info->original_csv_file_path());
      }

      std::shared_ptr<arrow::Buffer> background;
      if (csv.background) {
        info->set_background_path(StoreCsvAsset(id, "background-", *csv.background));
        info->set_background_file_name(csv.background->name);
        written.push_back(info->background_path());
        background = csv.background->data;
      } else if (!info->background_path().empty()) {
        background = store_->ReadBytes(info->background_path());
      }

      if (csv.regenerate_image) {
        info->set_rendered_image_path(RenderCsv(id, *info, background));
        written.push_back(info->rendered_image_path());
      }

      auto updated = ReplaceLocked(std::move(next));

      // files the new record no longer points at
      std::vector<std::string> replaced;
      const auto&              after = updated.csv_info();
      if (!before.rendered_image_path().empty() && before.rendered_image_path() != after.rendered_image_path()) {
        replaced.push_back(before.rendered_image_path());
      }
      if (!before.original_csv_file_path().empty() && before.original_csv_file_path() != after.original_csv_file_path()) {
        replaced.push_back(before.original_csv_file_path());
      }
      if (!before.background_path().empty() && before.background_path() != after.background_path()) {
        replaced.push_back(before.background_path());
      }
      RemovePaths(replaced);
      return updated;
    } catch (const std::exception&) {
      RemovePaths(written);
      throw;
    }
  });
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

/*
  Only files owned by content records are readable here:

      contents/files/<name>
      contents/thumbnails/<name>
      contents/csv-<id>/<name>
*/
std::shared_ptr<arrow::Buffer> ContentRepository::ReadFile(const std::string& storage_path) {
  try {
    storage::common::ValidatePath(storage_path);
  } catch (const std::invalid_argument&) {
    throw util::ValidationError("storagePath", "invalid path " + storage_path);
  }

  const auto dir     = storage::common::ParentPath(storage_path);
  const bool is_file = dir == "contents/files" || dir == "contents/thumbnails" ||
                       (dir.rfind("contents/csv-", 0) == 0 && dir.find('/', 9) == std::string::npos);
  if (!is_file || EndsWith(storage_path, ".tmp")) {
    throw util::ValidationError("storagePath", "not a content file: " + storage_path);
  }
  return store_->ReadBytes(storage_path);
}

ThumbnailRegenerationReport ContentRepository::RegenerateAllThumbnails() {
  ThumbnailRegenerationReport report;

  const auto entries = ListIndex();
  report.total       = entries.size();

  for (const auto& entry : entries) {
    if (entry.type() != CONTENT_TYPE_VIDEO && entry.type() != CONTENT_TYPE_IMAGE) {
      continue;
    }

    try {
      const bool regenerated = locks_->WithLock(EntityLockKey(entry.id()), [&] {
        auto current = ReadDetailLocked(entry.id());
        if (!current || !current->has_file_info()) {
          return false;
        }

        const auto& file_info = current->file_info();
        FileUpload  file{file_info.original_name(), file_info.mime_type(), store_->ReadBytes(file_info.storage_path())};

        ContentItem next = *current;
        if (!AttachThumbnail(next.id(), file, next.mutable_file_info())) {
          return false;
        }
        ReplaceLocked(std::move(next));
        return true;
      });

      if (regenerated) {
        ++report.success;
      } else {
        report.failed.push_back(entry.name());
      }
    } catch (const std::exception&) {
      report.failed.push_back(entry.name());
    }
  }

  return report;
}

// ------------------------------------------------------------------
// Private
// ------------------------------------------------------------------

void ContentRepository::RemoveAssets(const ContentItem& item) {
  std::vector<std::string> paths;
  if (item.has_file_info()) {
    paths.push_back(item.file_info().storage_path());
    if (!item.file_info().thumbnail_path().empty()) {
      paths.push_back(item.file_info().thumbnail_path());
    }
  }
  for (const auto& path : paths) {
    auto result = store_->Delete(path);
    if (!result && !result.IsNotFound()) {
      throw util::StoreError("delete " + path + ": " + result.message);
    }
  }

  if (item.has_csv_info()) {
    auto result = store_->DeleteTree(CsvAssetDir(item.id()));
    if (!result && !result.IsNotFound()) {
      throw util::StoreError("delete " + CsvAssetDir(item.id()) + ": " + result.message);
    }
  }
}

bool ContentRepository::AttachThumbnail(const std::string& id, const FileUpload& file, FileInfo* info) {
  if (!thumbnails_) {
    return false;
  }

  media::Thumbnail thumbnail;
  try {
    thumbnail = thumbnails_->Generate(file, media::ThumbnailGenerator::kDefaultMaxWidth);
  } catch (const std::exception&) {
    // best effort: the content is stored without a thumbnail
    return false;
  }
  if (!thumbnail.jpeg) {
    return false;
  }

  store_->WriteBytes(ThumbnailPath(id), thumbnail.jpeg);
  info->set_thumbnail_path(ThumbnailPath(id));
  *info->mutable_metadata() = thumbnail.metadata;
  return true;
}

std::string ContentRepository::RenderCsv(const std::string& id, const CsvInfo& csv, const std::shared_ptr<arrow::Buffer>& background) {
  if (!csv_renderer_) {
    throw util::InvalidState("csv renderer is not configured");
  }

  media::CsvRenderRequest request;
  request.csv_data = csv.edited_csv_data().empty() ? csv.original_csv_data() : csv.edited_csv_data();
  request.selected_rows.assign(csv.selected_rows().begin(), csv.selected_rows().end());
  request.selected_columns.assign(csv.selected_columns().begin(), csv.selected_columns().end());
  request.layout     = csv.layout();
  request.style      = csv.style();
  request.background = background;
  request.format     = csv.format() == IMAGE_FORMAT_UNSPECIFIED ? IMAGE_FORMAT_PNG : csv.format();
  request.api_url    = csv.api_url().empty() ? std::string(schema::kDefaultCsvRendererUrl) : csv.api_url();

  auto image = csv_renderer_->Render(request);
  if (!image.data || image.data->size() == 0) {
    throw util::InvalidState("csv renderer returned no image");
  }

  const auto stamp = std::to_string(util::ToUnixMillis(util::Now()));
  const auto path  = FreeAssetPath([&](int n) {
    return CsvAssetDir(id) + "/rendered-" + stamp + (n > 0 ? "-" + std::to_string(n) : "") + "." + Extension(image.format);
  });
  store_->WriteBytes(path, image.data);
  return path;
}

std::string ContentRepository::StoreCsvAsset(const std::string& id, const std::string& prefix, const FileUpload& file) {
  if (!file.data) {
    throw util::ValidationError(prefix + "file", "no data");
  }
  const auto name = SanitizeFileName(file.name);
  const auto path = FreeAssetPath([&](int n) { return CsvAssetDir(id) + "/" + prefix + (n > 0 ? std::to_string(n) + "-" : "") + name; });
  store_->WriteBytes(path, file.data);
  return path;
}

/*
  First candidate(0), candidate(1), ... not present in the store. Callers
  hold the entity or create lock, so the path stays free until written.
*/
std::string ContentRepository::FreeAssetPath(const std::function<std::string(int)>& candidate) {
  constexpr int kMaxAttempts = 1000;
  for (int n = 0; n < kMaxAttempts; ++n) {
    auto path = candidate(n);
    if (!store_->Exists(path)) {
      return path;
    }
  }
  throw util::AlreadyExists("no free asset name for " + candidate(0));
}

void ContentRepository::RemoveCsvDir(const std::string& id) {
  try {
    auto removed = store_->DeleteTree(CsvAssetDir(id));
    (void)removed;
  } catch (const util::StoreError&) {
    return;
  }
}

/*
  Cleanup after a failed or superseded write. Leftover files are only
  unreferenced bytes, so store failures here do not mask the caller's
  outcome.
*/
void ContentRepository::RemovePaths(const std::vector<std::string>& paths) {
  for (const auto& path : paths) {
    try {
      auto removed = store_->Delete(path);
      (void)removed;
    } catch (const util::StoreError&) {
      continue;
    }
  }
}

} // namespace signage::repository
