#include "internal/repository/schedule_repository.hpp"

#include <google/protobuf/util/field_mask_util.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "test_fixtures.hpp"

namespace {

using namespace signage::store::v1;
using signage::repository::ScheduleRepository;

struct Fixture {
  signage::storage::VirtualStorePtr     store     = signage::testing::MemoryStore();
  signage::lock::ResourceLockManagerPtr locks     = std::make_shared<signage::lock::ResourceLockManager>();
  std::shared_ptr<ScheduleRepository>   schedules = std::make_shared<ScheduleRepository>(store, locks);
};

void TestIndexIsOrderedByTimeOfDay() {
  Fixture f;
  f.schedules->Create(signage::testing::MakeSchedule("Late", "23:15", "p1"));
  f.schedules->Create(signage::testing::MakeSchedule("Open", "09:00", "p1"));
  f.schedules->Create(signage::testing::MakeSchedule("Early", "07:30", "p2"));

  auto entries = f.schedules->ListIndex();
  assert(entries.size() == 3);
  assert(entries[0].time() == "07:30");
  assert(entries[1].time() == "09:00");
  assert(entries[2].time() == "23:15");
}

void TestUpdatingTimeReordersIndex() {
  Fixture f;
  auto    first  = f.schedules->Create(signage::testing::MakeSchedule("A", "08:00", "p1"));
  auto    second = f.schedules->Create(signage::testing::MakeSchedule("B", "10:00", "p1"));

  ScheduleItem patch;
  patch.set_time("11:00");
  google::protobuf::FieldMask mask;
  mask.add_paths("time");
  f.schedules->Update(first.id(), patch, mask);

  auto entries = f.schedules->ListIndex();
  assert(entries[0].id() == second.id());
  assert(entries[1].id() == first.id());
  assert(entries[1].time() == "11:00");
}

void TestEnabledDefaultsToTrue() {
  Fixture f;
  auto    created = f.schedules->Create(signage::testing::MakeSchedule("Morning", "07:00", "p1"));
  assert(created.has_enabled() && created.enabled());
  assert(f.schedules->ListIndex()[0].enabled());

  auto disabled = signage::testing::MakeSchedule("Off", "08:00", "p1");
  disabled.set_enabled(false);
  assert(!f.schedules->Create(disabled).enabled());
}

void TestListByPlaylistOnlyMatchesPlaylistEvents() {
  Fixture f;
  f.schedules->Create(signage::testing::MakeSchedule("Morning", "07:00", "p1"));
  f.schedules->Create(signage::testing::MakeSchedule("Evening", "18:00", "p2"));

  auto power = signage::testing::MakeSchedule("Power", "06:00", "p1");
  power.mutable_event()->mutable_power_on();
  f.schedules->Create(power);

  auto matches = f.schedules->ListByPlaylist("p1");
  assert(matches.size() == 1);
  assert(matches[0].name() == "Morning");
  assert(f.schedules->ListByPlaylist("p3").empty());
}

} // namespace

int main() {
  TestIndexIsOrderedByTimeOfDay();
  TestUpdatingTimeReordersIndex();
  TestEnabledDefaultsToTrue();
  TestListByPlaylistOnlyMatchesPlaylistEvents();

  std::cout << "signage_unit_schedule_repository: pass\n";
  return 0;
}
