#include "schedule_repository.hpp"

#include <algorithm>

namespace signage::repository {

using namespace signage::store::v1;

// "HH:MM" compares lexicographically in time order.
void ScheduleTraits::SortIndex(std::vector<ScheduleIndexEntry>& entries) {
  std::stable_sort(entries.begin(), entries.end(), [](const ScheduleIndexEntry& a, const ScheduleIndexEntry& b) { return a.time() < b.time(); });
}

std::vector<ScheduleIndexEntry> ScheduleRepository::ListByPlaylist(const std::string& playlist_id) {
  std::vector<ScheduleIndexEntry> matches;
  for (auto& entry : ListIndex()) {
    if (entry.event_type() == SCHEDULE_EVENT_TYPE_PLAYLIST && entry.playlist_id() == playlist_id) {
      matches.push_back(std::move(entry));
    }
  }
  return matches;
}

} // namespace signage::repository
