#include "playlist_schema.hpp"

#include <unordered_set>

#include "internal/schema/schema_common.hpp"

namespace signage::schema {

using namespace signage::store::v1;

namespace {

void ValidateAssignment(const ContentAssignment& assignment, const std::string& field) {
  RequireNonEmpty(assignment.region_id(), Nested(field, "regionId"));

  std::unordered_set<std::string> content_ids;
  for (int i = 0; i < assignment.content_ids_size(); ++i) {
    RequireNonEmpty(assignment.content_ids(i), Indexed(Nested(field, "contentIds"), i));
    content_ids.insert(assignment.content_ids(i));
  }

  std::unordered_set<std::string> timed;
  for (int i = 0; i < assignment.content_durations_size(); ++i) {
    const auto& duration = assignment.content_durations(i);
    const auto  entry    = Indexed(Nested(field, "contentDurations"), i);

    Require(content_ids.count(duration.content_id()) > 0, Nested(entry, "contentId"),
            "content " + duration.content_id() + " is not in contentIds");
    Require(timed.insert(duration.content_id()).second, Nested(entry, "contentId"), "duplicate duration for " + duration.content_id());
    Require(duration.duration() >= 1, Nested(entry, "duration"), "must be at least 1 second");
  }
}

} // namespace

Playlist ValidatePlaylist(const Playlist& raw) {
  Playlist playlist = raw;

  RequireNonEmpty(playlist.id(), "id");
  RequireNonEmpty(playlist.name(), "name");
  RequireNonEmpty(playlist.layout_id(), "layoutId");
  RequireNonEmpty(playlist.device(), "device");
  NormalizeTimestamps(playlist.mutable_created_at(), playlist.mutable_updated_at());

  std::unordered_set<std::string> regions;
  for (int i = 0; i < playlist.content_assignments_size(); ++i) {
    const auto  field      = Indexed("contentAssignments", i);
    const auto& assignment = playlist.content_assignments(i);
    ValidateAssignment(assignment, field);
    Require(regions.insert(assignment.region_id()).second, Nested(field, "regionId"), "duplicate assignment for region " + assignment.region_id());
  }

  return playlist;
}

void ValidatePlaylistAgainstLayout(const Playlist& playlist, const Layout& layout) {
  Require(layout.regions_size() > 0, "layoutId", "layout " + layout.id() + " has no regions");

  std::unordered_set<std::string> region_ids;
  for (const auto& region : layout.regions()) {
    region_ids.insert(region.id());
  }

  for (int i = 0; i < playlist.content_assignments_size(); ++i) {
    const auto& region_id = playlist.content_assignments(i).region_id();
    Require(region_ids.count(region_id) > 0, Nested(Indexed("contentAssignments", i), "regionId"),
            "region " + region_id + " is not part of layout " + layout.id());
  }
}

PlaylistIndexEntry ValidatePlaylistIndexEntry(const PlaylistIndexEntry& raw) {
  PlaylistIndexEntry entry = raw;
  RequireNonEmpty(entry.id(), "id");
  RequireNonEmpty(entry.name(), "name");
  Require(entry.content_count() >= 0, "contentCount", "must not be negative");
  NormalizeTimestamps(entry.mutable_created_at(), entry.mutable_updated_at());
  return entry;
}

int CountContents(const Playlist& playlist) {
  int count = 0;
  for (const auto& assignment : playlist.content_assignments()) {
    count += assignment.content_ids_size();
  }
  return count;
}

PlaylistIndexEntry ToPlaylistIndexEntry(const Playlist& playlist) {
  PlaylistIndexEntry entry;
  entry.set_id(playlist.id());
  entry.set_name(playlist.name());
  entry.set_layout_id(playlist.layout_id());
  entry.set_content_count(CountContents(playlist));
  entry.set_device(playlist.device());
  *entry.mutable_created_at() = playlist.created_at();
  *entry.mutable_updated_at() = playlist.updated_at();
  return entry;
}

} // namespace signage::schema
