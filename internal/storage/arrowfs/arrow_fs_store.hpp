#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>
#include <vector>

#include "internal/storage/virtual_store.hpp"

namespace signage::storage {

/*
  VirtualStore over an Arrow filesystem.

  Writes go to "<path>.tmp" and are moved over the final path once the
  stream is closed.
*/
class ArrowFsStore : public VirtualStore {
 public:
  explicit ArrowFsStore(std::shared_ptr<arrow::fs::FileSystem> fs);

  std::shared_ptr<arrow::Buffer> ReadBytes(const std::string& path) override;
  void                           WriteBytes(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) override;
  Result                         Delete(const std::string& path) override;
  Result                         DeleteTree(const std::string& dir) override;
  std::optional<FileStat>        Stat(const std::string& path) override;
  std::vector<std::string>       ListChildren(const std::string& dir) override;

  static constexpr const char* kTempSuffix = ".tmp";

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
};

} // namespace signage::storage
