#pragma once

#include "config/config.pb.h"
#include "internal/storage/virtual_store.hpp"

namespace signage::storage {

class StoreFactory {
 public:
  /*
    local  → SubTreeFileSystem(root_path) over LocalFileSystem; root is created
    memory → Arrow in-memory mock filesystem, lost at exit
  */
  static VirtualStorePtr Build(const signage::runtime::config::StoreConfig& cfg);

  static VirtualStorePtr BuildInMemory();
};

} // namespace signage::storage
