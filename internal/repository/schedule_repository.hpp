#pragma once

#include <vector>

#include "internal/repository/indexed_repository.hpp"
#include "internal/schema/schedule_schema.hpp"
#include "signage/store/v1.hpp"

namespace signage::repository {

struct ScheduleTraits {
  using Item       = signage::store::v1::ScheduleItem;
  using IndexEntry = signage::store::v1::ScheduleIndexEntry;
  using IndexFile  = signage::store::v1::ScheduleIndex;

  static constexpr const char* kEntity    = "schedule";
  static constexpr const char* kDirectory = "schedules";

  static Item Validate(const Item& raw) {
    return schema::ValidateSchedule(raw);
  }
  static IndexEntry ValidateIndexEntry(const IndexEntry& raw) {
    return schema::ValidateScheduleIndexEntry(raw);
  }
  static IndexEntry ToIndexEntry(const Item& item) {
    return schema::ToScheduleIndexEntry(item);
  }
  static void SortIndex(std::vector<IndexEntry>& entries);
};

/*
  The schedule index is kept sorted by time of day, ties in insertion
  order.
*/
class ScheduleRepository : public IndexedRepository<ScheduleTraits> {
 public:
  using IndexedRepository::IndexedRepository;

  // Schedules whose event triggers playlist_id.
  std::vector<signage::store::v1::ScheduleIndexEntry> ListByPlaylist(const std::string& playlist_id);
};

using ScheduleRepositoryPtr = std::shared_ptr<ScheduleRepository>;

} // namespace signage::repository
