#pragma once

#include <arrow/buffer.h>
#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <vector>

#include "signage/store/v1.hpp"

namespace signage::media {

struct CsvRenderRequest {
  // edited data when present, otherwise the original upload
  std::string                       csv_data;
  std::vector<int>                  selected_rows;
  std::vector<int>                  selected_columns;
  google::protobuf::Struct          layout;
  google::protobuf::Struct          style;
  std::shared_ptr<arrow::Buffer>    background;
  signage::store::v1::ImageFormat   format = signage::store::v1::IMAGE_FORMAT_PNG;
  std::string                       api_url;
};

struct RenderedImage {
  std::shared_ptr<arrow::Buffer>    data;
  signage::store::v1::ImageFormat   format = signage::store::v1::IMAGE_FORMAT_PNG;
};

/*
  Renders the selected rows/columns of a CSV to an image. Implementations
  live outside this library; failures are reported by throwing and abort
  the content operation that asked for the render.
*/
class CsvRenderer {
 public:
  virtual ~CsvRenderer() = default;

  virtual RenderedImage Render(const CsvRenderRequest& request) = 0;
};

using CsvRendererPtr = std::shared_ptr<CsvRenderer>;

} // namespace signage::media
