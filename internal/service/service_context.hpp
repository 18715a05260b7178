#pragma once

#include <memory>

namespace signage::repository {
class ContentRepository;
class LayoutRepository;
class PlaylistRepository;
class ScheduleRepository;
} // namespace signage::repository
namespace signage::integrity {
class UsageChecker;
class ReferenceGuard;
} // namespace signage::integrity

namespace signage::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<signage::repository::ContentRepository>  contents;
  std::shared_ptr<signage::repository::LayoutRepository>   layouts;
  std::shared_ptr<signage::repository::PlaylistRepository> playlists;
  std::shared_ptr<signage::repository::ScheduleRepository> schedules;
  std::shared_ptr<signage::integrity::UsageChecker>        usage;
  std::shared_ptr<signage::integrity::ReferenceGuard>      references;
};

} // namespace signage::service
