#include "store_factory.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/mockfs.h>

#include <chrono>
#include <stdexcept>

#include "internal/storage/arrowfs/arrow_fs_store.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/time.hpp"

namespace signage::storage {

using signage::storage::common::Unwrap;

VirtualStorePtr StoreFactory::Build(const signage::runtime::config::StoreConfig& cfg) {
  switch (cfg.backend_case()) {
    case signage::runtime::config::StoreConfig::kLocal: {
      const auto& root = cfg.local().root_path();
      if (root.empty()) {
        throw std::invalid_argument("store.local.root_path must not be empty");
      }

      auto local = std::make_shared<arrow::fs::LocalFileSystem>();
      Unwrap(local->CreateDir(root, /*recursive=*/true), "mkdir " + root);
      return std::make_shared<ArrowFsStore>(std::make_shared<arrow::fs::SubTreeFileSystem>(root, local));
    }
    case signage::runtime::config::StoreConfig::kMemory:
      return BuildInMemory();
    case signage::runtime::config::StoreConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::invalid_argument("store backend not configured");
}

VirtualStorePtr StoreFactory::BuildInMemory() {
  arrow::fs::TimePoint now = std::chrono::time_point_cast<arrow::fs::TimePoint::duration>(util::Now());
  return std::make_shared<ArrowFsStore>(std::make_shared<arrow::fs::internal::MockFileSystem>(now));
}

} // namespace signage::storage
