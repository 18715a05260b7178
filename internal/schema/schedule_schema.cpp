#include "schedule_schema.hpp"

#include <algorithm>
#include <vector>

#include "internal/schema/schema_common.hpp"

namespace signage::schema {

using namespace signage::store::v1;

namespace {

// Sorted, duplicate-free weekday set.
void NormalizeWeekdays(google::protobuf::RepeatedField<int>* weekdays) {
  std::vector<int> days(weekdays->begin(), weekdays->end());
  for (size_t i = 0; i < days.size(); ++i) {
    Require(days[i] != WEEKDAY_UNSPECIFIED && Weekday_IsValid(days[i]), Indexed("weekdays", static_cast<int>(i)), "must be monday through sunday");
  }
  std::sort(days.begin(), days.end());
  days.erase(std::unique(days.begin(), days.end()), days.end());

  weekdays->Clear();
  for (int day : days) {
    weekdays->Add(day);
  }
}

} // namespace

ScheduleEventType EventTypeOf(const ScheduleEvent& event) {
  switch (event.kind_case()) {
    case ScheduleEvent::kPlaylist:
      return SCHEDULE_EVENT_TYPE_PLAYLIST;
    case ScheduleEvent::kPowerOn:
      return SCHEDULE_EVENT_TYPE_POWER_ON;
    case ScheduleEvent::kPowerOff:
      return SCHEDULE_EVENT_TYPE_POWER_OFF;
    case ScheduleEvent::kReboot:
      return SCHEDULE_EVENT_TYPE_REBOOT;
    case ScheduleEvent::KIND_NOT_SET:
      break;
  }
  return SCHEDULE_EVENT_TYPE_UNSPECIFIED;
}

ScheduleItem ValidateSchedule(const ScheduleItem& raw) {
  ScheduleItem schedule = raw;

  if (!schedule.has_enabled()) {
    schedule.set_enabled(true);
  }

  RequireNonEmpty(schedule.id(), "id");
  RequireNonEmpty(schedule.name(), "name");
  Require(IsTimeOfDay(schedule.time()), "time", "must be HH:MM between 00:00 and 23:59");
  Require(schedule.weekdays_size() > 0, "weekdays", "at least one weekday is required");
  NormalizeWeekdays(schedule.mutable_weekdays());
  NormalizeTimestamps(schedule.mutable_created_at(), schedule.mutable_updated_at());

  Require(EventTypeOf(schedule.event()) != SCHEDULE_EVENT_TYPE_UNSPECIFIED, "event", "must be set");
  if (schedule.event().has_playlist()) {
    RequireNonEmpty(schedule.event().playlist().playlist_id(), "event.playlist.playlistId");
  }

  return schedule;
}

ScheduleIndexEntry ValidateScheduleIndexEntry(const ScheduleIndexEntry& raw) {
  ScheduleIndexEntry entry = raw;

  if (entry.weekdays_size() == 0) {
    for (int day = WEEKDAY_MONDAY; day <= WEEKDAY_SUNDAY; ++day) {
      entry.add_weekdays(static_cast<Weekday>(day));
    }
  }

  RequireNonEmpty(entry.id(), "id");
  RequireNonEmpty(entry.name(), "name");
  Require(IsTimeOfDay(entry.time()), "time", "must be HH:MM between 00:00 and 23:59");
  NormalizeWeekdays(entry.mutable_weekdays());
  Require(entry.event_type() != SCHEDULE_EVENT_TYPE_UNSPECIFIED, "eventType", "must be set");
  NormalizeTimestamps(entry.mutable_created_at(), entry.mutable_updated_at());
  return entry;
}

ScheduleIndexEntry ToScheduleIndexEntry(const ScheduleItem& schedule) {
  ScheduleIndexEntry entry;
  entry.set_id(schedule.id());
  entry.set_name(schedule.name());
  entry.set_time(schedule.time());
  *entry.mutable_weekdays() = schedule.weekdays();
  entry.set_event_type(EventTypeOf(schedule.event()));
  if (schedule.event().has_playlist()) {
    entry.set_playlist_id(schedule.event().playlist().playlist_id());
  }
  entry.set_enabled(schedule.enabled());
  *entry.mutable_created_at() = schedule.created_at();
  *entry.mutable_updated_at() = schedule.updated_at();
  return entry;
}

} // namespace signage::schema
