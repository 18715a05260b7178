#pragma once

#include <arrow/buffer.h>

#include <memory>

#include "internal/media/media_types.hpp"
#include "signage/store/v1.hpp"

namespace signage::media {

struct Thumbnail {
  std::shared_ptr<arrow::Buffer>      jpeg;
  signage::store::v1::MediaMetadata   metadata;
};

/*
  Produces a JPEG thumbnail no wider than max_width plus the media's
  dimensions (and duration for video). Implementations live outside this
  library; failures are reported by throwing.
*/
class ThumbnailGenerator {
 public:
  static constexpr int kDefaultMaxWidth = 400;

  virtual ~ThumbnailGenerator() = default;

  virtual Thumbnail Generate(const FileUpload& file, int max_width) = 0;
};

using ThumbnailGeneratorPtr = std::shared_ptr<ThumbnailGenerator>;

} // namespace signage::media
