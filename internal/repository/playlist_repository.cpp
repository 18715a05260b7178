#include "playlist_repository.hpp"

#include <algorithm>

#include "internal/schema/schema_common.hpp"

namespace signage::repository {

using namespace signage::store::v1;

PlaylistRepository::PlaylistRepository(storage::VirtualStorePtr store, lock::ResourceLockManagerPtr locks, LayoutRepositoryPtr layouts)
    : IndexedRepository(std::move(store), std::move(locks)), layouts_(std::move(layouts)) {
}

void PlaylistRepository::ValidateForWrite(const Playlist& playlist) {
  auto layout = layouts_->GetById(playlist.layout_id());
  if (!layout) {
    schema::Fail("layoutId", "layout not found: " + playlist.layout_id());
  }
  schema::ValidatePlaylistAgainstLayout(playlist, *layout);
}

bool PlaylistRepository::StripContentReferences(const std::string& playlist_id, const std::string& content_id) {
  ValidateId(playlist_id);
  return locks_->WithLock(EntityLockKey(playlist_id), [&] {
    auto current = ReadDetailLocked(playlist_id);
    if (!current) {
      throw util::NotFound("playlist not found: " + playlist_id);
    }

    Playlist next    = *current;
    bool     changed = false;
    for (auto& assignment : *next.mutable_content_assignments()) {
      auto* ids       = assignment.mutable_content_ids();
      auto  ids_end   = std::remove(ids->begin(), ids->end(), content_id);
      const int removed_ids = static_cast<int>(ids->end() - ids_end);
      if (removed_ids > 0) {
        ids->DeleteSubrange(ids->size() - removed_ids, removed_ids);
        changed = true;
      }

      auto* durations     = assignment.mutable_content_durations();
      auto  durations_end = std::remove_if(durations->begin(), durations->end(),
                                           [&](const ContentDuration& duration) { return duration.content_id() == content_id; });
      const int removed_durations = static_cast<int>(durations->end() - durations_end);
      if (removed_durations > 0) {
        durations->DeleteSubrange(durations->size() - removed_durations, removed_durations);
        changed = true;
      }
    }

    if (!changed) {
      return false;
    }
    ReplaceLocked(std::move(next));
    return true;
  });
}

} // namespace signage::repository
