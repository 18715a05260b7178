#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace signage::media {

/*
  A file handed in by the user for upload.
*/
struct FileUpload {
  std::string                    name;
  std::string                    mime_type;
  std::shared_ptr<arrow::Buffer> data;

  uint64_t size() const {
    return data ? static_cast<uint64_t>(data->size()) : 0;
  }
};

} // namespace signage::media
