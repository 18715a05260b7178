#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/repository/indexed_repository.hpp"
#include "internal/repository/layout_repository.hpp"
#include "internal/schema/playlist_schema.hpp"
#include "signage/store/v1.hpp"

namespace signage::repository {

struct PlaylistTraits {
  using Item       = signage::store::v1::Playlist;
  using IndexEntry = signage::store::v1::PlaylistIndexEntry;
  using IndexFile  = signage::store::v1::PlaylistIndex;

  static constexpr const char* kEntity    = "playlist";
  static constexpr const char* kDirectory = "playlists";

  static Item Validate(const Item& raw) {
    return schema::ValidatePlaylist(raw);
  }
  static IndexEntry ValidateIndexEntry(const IndexEntry& raw) {
    return schema::ValidatePlaylistIndexEntry(raw);
  }
  static IndexEntry ToIndexEntry(const Item& item) {
    return schema::ToPlaylistIndexEntry(item);
  }
  static void SortIndex(std::vector<IndexEntry>&) {
  }
};

/*
  Playlists are written only against an existing layout: the layout must
  have regions and every assignment must target one of them. Referenced
  content ids are not checked.
*/
class PlaylistRepository : public IndexedRepository<PlaylistTraits> {
 public:
  PlaylistRepository(storage::VirtualStorePtr store, lock::ResourceLockManagerPtr locks, LayoutRepositoryPtr layouts);

  /*
    Removes content_id from every assignment and duration list of the
    playlist. Returns false when the playlist did not reference it.
    Throws util::NotFound when the playlist is gone.
  */
  bool StripContentReferences(const std::string& playlist_id, const std::string& content_id);

 protected:
  void ValidateForWrite(const signage::store::v1::Playlist& playlist) override;

 private:
  LayoutRepositoryPtr layouts_;
};

using PlaylistRepositoryPtr = std::shared_ptr<PlaylistRepository>;

} // namespace signage::repository
