#pragma once

#include "signage/store/v1.hpp"

namespace signage::schema {

/*
  Structural checks only. Whether the assignments fit the referenced
  layout is checked by PlaylistRepository, which can resolve the layout.
*/
signage::store::v1::Playlist ValidatePlaylist(const signage::store::v1::Playlist& raw);

/*
  Every assignment's regionId must be a region of layout, and the layout
  must have at least one region.
*/
void ValidatePlaylistAgainstLayout(const signage::store::v1::Playlist& playlist, const signage::store::v1::Layout& layout);

signage::store::v1::PlaylistIndexEntry ValidatePlaylistIndexEntry(const signage::store::v1::PlaylistIndexEntry& raw);

signage::store::v1::PlaylistIndexEntry ToPlaylistIndexEntry(const signage::store::v1::Playlist& playlist);

// Number of content ids across all assignments.
int CountContents(const signage::store::v1::Playlist& playlist);

} // namespace signage::schema
