#pragma once

#include "signage/store/v1.hpp"

namespace signage::schema {

signage::store::v1::ScheduleItem ValidateSchedule(const signage::store::v1::ScheduleItem& raw);

/*
  Index entries written before weekdays were indexed get all seven days.
*/
signage::store::v1::ScheduleIndexEntry ValidateScheduleIndexEntry(const signage::store::v1::ScheduleIndexEntry& raw);

signage::store::v1::ScheduleIndexEntry ToScheduleIndexEntry(const signage::store::v1::ScheduleItem& schedule);

signage::store::v1::ScheduleEventType EventTypeOf(const signage::store::v1::ScheduleEvent& event);

} // namespace signage::schema
