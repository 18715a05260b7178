#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/repository/content_repository.hpp"
#include "internal/repository/playlist_repository.hpp"
#include "internal/repository/schedule_repository.hpp"
#include "signage/store/v1.hpp"

namespace signage::integrity {

struct PlaylistReference {
  std::string id;
  std::string name;
  std::string device;
  // occurrences of the target inside the playlist (content) or 1 (layout)
  int region_count = 0;
};

struct Usage {
  bool                           is_used     = false;
  int                            usage_count = 0;
  std::vector<PlaylistReference> playlists;
};

struct ScheduleReference {
  std::string id;
  std::string name;
  std::string time;
};

struct PlaylistUsage {
  bool                           is_used = false;
  std::vector<ScheduleReference> schedules;
};

/*
  Read-only scans for references by id. Scans run without entity locks
  and see a snapshot that may be stale by the time the caller acts on it.
*/
class UsageChecker {
 public:
  UsageChecker(repository::ContentRepositoryPtr contents, repository::PlaylistRepositoryPtr playlists, repository::ScheduleRepositoryPtr schedules);

  // Playlists whose assignments list content_id.
  Usage CheckContentUsage(const std::string& content_id);

  // Playlists built on layout_id.
  Usage CheckLayoutUsage(const std::string& layout_id);

  // Schedules that trigger playlist_id.
  PlaylistUsage CheckPlaylistUsage(const std::string& playlist_id);

  std::unordered_set<std::string> UsedContentIds();

  // Index entries of content no playlist references.
  std::vector<signage::store::v1::ContentIndexEntry> UnusedContents();

  /*
    Human readable reference list, e.g.
      used by playlist "Lobby"
      used by 2 playlists ("Lobby", "Entrance")
    Empty when unused.
  */
  static std::string DescribeUsage(const Usage& usage, const std::string& subject);

 private:
  repository::ContentRepositoryPtr  contents_;
  repository::PlaylistRepositoryPtr playlists_;
  repository::ScheduleRepositoryPtr schedules_;
};

using UsageCheckerPtr = std::shared_ptr<UsageChecker>;

} // namespace signage::integrity
