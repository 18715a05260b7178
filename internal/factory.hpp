#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/integrity/reference_guard.hpp"
#include "internal/integrity/usage_checker.hpp"
#include "internal/lock/resource_lock_manager.hpp"
#include "internal/media/csv_renderer.hpp"
#include "internal/media/thumbnail_generator.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/storage/virtual_store.hpp"

namespace signage::factory {

/*
  Application

  Owns all long-lived components. One instance per store root; two
  instances over the same root do not share locks.
*/
struct Application {
  storage::VirtualStorePtr         store;
  lock::ResourceLockManagerPtr     locks;
  service::ServiceContext          context;
  std::shared_ptr<service::CatalogService> catalog;
};

/*
  Composition root. thumbnails and csv_renderer are optional: without a
  generator media is stored without thumbnails, without a renderer CSV
  content cannot be created.
*/
Application Build(const signage::runtime::config::RuntimeConfig& config, media::ThumbnailGeneratorPtr thumbnails = nullptr,
                  media::CsvRendererPtr csv_renderer = nullptr);

Application BuildWithStore(storage::VirtualStorePtr store, media::ThumbnailGeneratorPtr thumbnails = nullptr,
                           media::CsvRendererPtr csv_renderer = nullptr);

} // namespace signage::factory
