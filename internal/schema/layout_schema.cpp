#include "layout_schema.hpp"

#include <unordered_set>

#include "internal/schema/schema_common.hpp"

namespace signage::schema {

using namespace signage::store::v1;

Layout ValidateLayout(const Layout& raw) {
  Layout layout = raw;

  RequireNonEmpty(layout.id(), "id");
  RequireNonEmpty(layout.name(), "name");
  Require(layout.orientation() != ORIENTATION_UNSPECIFIED, "orientation", "must be landscape, portrait-right or portrait-left");
  Require(layout.regions_size() <= kMaxRegions, "regions", "at most " + std::to_string(kMaxRegions) + " regions");
  NormalizeTimestamps(layout.mutable_created_at(), layout.mutable_updated_at());

  std::unordered_set<std::string> region_ids;
  for (int i = 0; i < layout.regions_size(); ++i) {
    auto*      region = layout.mutable_regions(i);
    const auto field  = Indexed("regions", i);

    if (!region->has_z_index()) {
      region->set_z_index(i);
    }

    RequireNonEmpty(region->id(), Nested(field, "id"));
    Require(region_ids.insert(region->id()).second, Nested(field, "id"), "duplicate region id " + region->id());
    Require(region->x() >= 0, Nested(field, "x"), "must not be negative");
    Require(region->y() >= 0, Nested(field, "y"), "must not be negative");
    Require(region->width() >= 1, Nested(field, "width"), "must be at least 1");
    Require(region->height() >= 1, Nested(field, "height"), "must be at least 1");
    Require(region->z_index() >= 0, Nested(field, "zIndex"), "must not be negative");
  }

  return layout;
}

LayoutIndexEntry ValidateLayoutIndexEntry(const LayoutIndexEntry& raw) {
  LayoutIndexEntry entry = raw;
  RequireNonEmpty(entry.id(), "id");
  RequireNonEmpty(entry.name(), "name");
  Require(entry.region_count() >= 0, "regionCount", "must not be negative");
  NormalizeTimestamps(entry.mutable_created_at(), entry.mutable_updated_at());
  return entry;
}

LayoutIndexEntry ToLayoutIndexEntry(const Layout& layout) {
  LayoutIndexEntry entry;
  entry.set_id(layout.id());
  entry.set_name(layout.name());
  entry.set_orientation(layout.orientation());
  entry.set_region_count(layout.regions_size());
  *entry.mutable_created_at() = layout.created_at();
  *entry.mutable_updated_at() = layout.updated_at();
  return entry;
}

} // namespace signage::schema
