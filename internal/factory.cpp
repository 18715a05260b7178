#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/repository/content_repository.hpp"
#include "internal/repository/layout_repository.hpp"
#include "internal/repository/playlist_repository.hpp"
#include "internal/repository/schedule_repository.hpp"
#include "internal/storage/store_factory.hpp"

namespace signage::factory {

/*
    Build full application dependency graph
*/
Application Build(const signage::runtime::config::RuntimeConfig& config, media::ThumbnailGeneratorPtr thumbnails,
                  media::CsvRendererPtr csv_renderer) {
  auto store = storage::StoreFactory::Build(config.store());
  SIGNAGE_LOG_INFO("store opened", {observability::StringField("backend", config.store().has_memory() ? "memory" : "local"),
                                    observability::StringField("root", config.store().local().root_path())});
  return BuildWithStore(std::move(store), std::move(thumbnails), std::move(csv_renderer));
}

Application BuildWithStore(storage::VirtualStorePtr store, media::ThumbnailGeneratorPtr thumbnails, media::CsvRendererPtr csv_renderer) {
  if (!store) {
    throw std::invalid_argument("build: store is required");
  }

  Application app;
  app.store = std::move(store);
  app.locks = std::make_shared<lock::ResourceLockManager>();

  // ------------------------------------------------------------------
  // Repositories
  // ------------------------------------------------------------------
  auto contents  = std::make_shared<repository::ContentRepository>(app.store, app.locks, std::move(thumbnails), std::move(csv_renderer));
  auto layouts   = std::make_shared<repository::LayoutRepository>(app.store, app.locks);
  auto playlists = std::make_shared<repository::PlaylistRepository>(app.store, app.locks, layouts);
  auto schedules = std::make_shared<repository::ScheduleRepository>(app.store, app.locks);

  // ------------------------------------------------------------------
  // Integrity
  // ------------------------------------------------------------------
  auto usage      = std::make_shared<integrity::UsageChecker>(contents, playlists, schedules);
  auto references = std::make_shared<integrity::ReferenceGuard>(usage, contents, layouts, playlists);

  // the guard owns the layout repository; a weak handle avoids a cycle
  layouts->SetRegionCheck([guard = std::weak_ptr<integrity::ReferenceGuard>(references)](const store::v1::Layout& layout) {
    if (auto locked = guard.lock()) {
      locked->CheckLayoutRegions(layout);
    }
  });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.contents   = contents;
  app.context.layouts    = layouts;
  app.context.playlists  = playlists;
  app.context.schedules  = schedules;
  app.context.usage      = usage;
  app.context.references = references;

  app.catalog = std::make_shared<service::CatalogService>(app.context);
  return app;
}

} // namespace signage::factory
