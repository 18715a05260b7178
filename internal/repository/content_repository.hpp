#pragma once

#include <arrow/buffer.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/media/csv_renderer.hpp"
#include "internal/media/media_types.hpp"
#include "internal/media/thumbnail_generator.hpp"
#include "internal/repository/indexed_repository.hpp"
#include "internal/schema/content_schema.hpp"
#include "signage/store/v1.hpp"

namespace signage::repository {

struct ContentTraits {
  using Item       = signage::store::v1::ContentItem;
  using IndexEntry = signage::store::v1::ContentIndexEntry;
  using IndexFile  = signage::store::v1::ContentIndex;

  static constexpr const char* kEntity    = "content";
  static constexpr const char* kDirectory = "contents";

  static Item Validate(const Item& raw) {
    return schema::ValidateContent(raw);
  }
  static IndexEntry ValidateIndexEntry(const IndexEntry& raw) {
    return schema::ValidateContentIndexEntry(raw);
  }
  static IndexEntry ToIndexEntry(const Item& item) {
    return schema::ToContentIndexEntry(item);
  }
  static void SortIndex(std::vector<IndexEntry>&) {
  }
};

struct CsvContentRequest {
  std::string name;
  // data, selection, layout, style, format and apiUrl; paths are assigned
  signage::store::v1::CsvInfo       csv;
  std::optional<media::FileUpload>  csv_file;
  std::optional<media::FileUpload>  background;
  std::vector<std::string>          tags;
};

struct CsvAssetUpdate {
  bool                              regenerate_image = false;
  std::optional<media::FileUpload>  csv_file;
  std::optional<media::FileUpload>  background;
};

struct ThumbnailRegenerationReport {
  size_t                   total   = 0;
  size_t                   success = 0;
  std::vector<std::string> failed;  // content names
};

/*
  Content records plus the files they own:

      contents/files/<id>-<name>        uploaded media
      contents/thumbnails/<id>.jpg      generated thumbnail
      contents/csv-<id>/                CSV source, background, rendered image

  Thumbnail generation is best effort: a content item is created without
  a thumbnail when the generator is absent or fails. CSV rendering is
  required: a render failure aborts the create/update and removes every
  file written for it.
*/
class ContentRepository : public IndexedRepository<ContentTraits> {
 public:
  ContentRepository(storage::VirtualStorePtr store, lock::ResourceLockManagerPtr locks, media::ThumbnailGeneratorPtr thumbnails,
                    media::CsvRendererPtr csv_renderer);

  /*
    video/* and image/* uploads only. name defaults to the file name.
  */
  signage::store::v1::ContentItem CreateFileContent(const media::FileUpload& file, const std::string& name = {},
                                                    const std::vector<std::string>& tags = {});

  /*
    Text files (text/* or a known text extension) become text content
    with default styling; everything else goes to CreateFileContent.
  */
  signage::store::v1::ContentItem CreateFileOrTextContent(const media::FileUpload& file, const std::string& name = {},
                                                          const std::vector<std::string>& tags = {});

  /*
    YouTube watch/short links become youtube content, anything else url
    content. name falls back to title, then to the URL.
  */
  signage::store::v1::ContentItem CreateUrlContent(const std::string& url, const std::string& name = {}, const std::string& title = {},
                                                   const std::string& description = {}, const std::vector<std::string>& tags = {});

  signage::store::v1::ContentItem CreateTextContent(const std::string& name, const signage::store::v1::TextInfo& text,
                                                    const std::vector<std::string>& tags = {});

  signage::store::v1::ContentItem CreateWeatherContent(const std::string& name, const signage::store::v1::WeatherInfo& weather,
                                                       const std::vector<std::string>& tags = {});

  signage::store::v1::ContentItem CreateCsvContent(const CsvContentRequest& request);

  /*
    Update() plus CSV handling: new CSV/background uploads are stored and,
    when regenerate_image is set, the image is rendered again from the
    merged record inside the same lock acquisition.
  */
  signage::store::v1::ContentItem UpdateContent(const std::string& id, const signage::store::v1::ContentItem& patch,
                                                const google::protobuf::FieldMask& mask, const CsvAssetUpdate& csv = {});

  std::shared_ptr<arrow::Buffer> ReadFile(const std::string& storage_path);

  ThumbnailRegenerationReport RegenerateAllThumbnails();

  static std::string FilePath(const std::string& id, const std::string& file_name);
  static std::string ThumbnailPath(const std::string& id);
  static std::string CsvAssetDir(const std::string& id);

  static bool IsTextFile(const media::FileUpload& file);

 protected:
  void RemoveAssets(const signage::store::v1::ContentItem& item) override;

 private:
  // Generates and stores a thumbnail; false when none could be produced.
  bool AttachThumbnail(const std::string& id, const media::FileUpload& file, signage::store::v1::FileInfo* info);

  // Renders csv into a new image file under the content's CSV directory.
  std::string RenderCsv(const std::string& id, const signage::store::v1::CsvInfo& csv, const std::shared_ptr<arrow::Buffer>& background);

  std::string StoreCsvAsset(const std::string& id, const std::string& prefix, const media::FileUpload& file);

  std::string FreeAssetPath(const std::function<std::string(int)>& candidate);

  void RemovePaths(const std::vector<std::string>& paths);
  void RemoveCsvDir(const std::string& id);

  media::ThumbnailGeneratorPtr thumbnails_;
  media::CsvRendererPtr        csv_renderer_;
};

using ContentRepositoryPtr = std::shared_ptr<ContentRepository>;

} // namespace signage::repository
