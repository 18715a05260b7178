#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/schema/content_schema.hpp"
#include "internal/schema/layout_schema.hpp"
#include "internal/schema/playlist_schema.hpp"
#include "internal/schema/schedule_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "signage/store/v1.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace signage::store::v1;
using google::protobuf::util::MessageDifferencer;

template <typename Fn>
std::string ExpectValidationError(Fn&& fn) {
  try {
    fn();
  } catch (const signage::util::ValidationError& e) {
    return e.field();
  }
  assert(false && "expected ValidationError");
  return {};
}

void Stamp(google::protobuf::Timestamp* created_at) {
  *created_at = signage::util::ToProto(signage::util::Now());
}

Layout StoredLayout() {
  auto layout = signage::testing::MakeLayout("Split", {"left", "right"});
  layout.set_id("l1");
  Stamp(layout.mutable_created_at());
  return layout;
}

void TestLayoutDefaultsZIndexToRegionPosition() {
  auto layout = StoredLayout();
  layout.mutable_regions(1)->set_z_index(5);

  auto valid = signage::schema::ValidateLayout(layout);
  assert(valid.regions(0).has_z_index() && valid.regions(0).z_index() == 0);
  assert(valid.regions(1).z_index() == 5);
  assert(MessageDifferencer::Equals(valid.updated_at(), valid.created_at()));
}

void TestLayoutRejectsBadRegions() {
  auto zero_width = StoredLayout();
  zero_width.mutable_regions(1)->set_width(0);
  assert(ExpectValidationError([&] { signage::schema::ValidateLayout(zero_width); }) == "regions[1].width");

  auto duplicate = StoredLayout();
  duplicate.mutable_regions(1)->set_id("left");
  assert(ExpectValidationError([&] { signage::schema::ValidateLayout(duplicate); }) == "regions[1].id");

  auto too_many = signage::testing::MakeLayout("Grid", {"a", "b", "c", "d", "e"});
  too_many.set_id("l2");
  Stamp(too_many.mutable_created_at());
  assert(ExpectValidationError([&] { signage::schema::ValidateLayout(too_many); }) == "regions");

  auto no_created = StoredLayout();
  no_created.clear_created_at();
  assert(ExpectValidationError([&] { signage::schema::ValidateLayout(no_created); }) == "createdAt");
}

void TestValidationIsIdempotent() {
  auto once  = signage::schema::ValidateLayout(StoredLayout());
  auto twice = signage::schema::ValidateLayout(once);
  assert(MessageDifferencer::Equals(once, twice));

  ContentItem text;
  text.set_id("c1");
  text.set_name("Welcome");
  text.set_type(CONTENT_TYPE_TEXT);
  *text.mutable_text_info() = signage::testing::MakeText("hello");
  text.add_tags("lobby");
  text.add_tags("lobby");
  Stamp(text.mutable_created_at());

  auto content_once = signage::schema::ValidateContent(text);
  assert(content_once.tags_size() == 1);
  assert(MessageDifferencer::Equals(content_once, signage::schema::ValidateContent(content_once)));
}

void TestTextDefaultsAndRanges() {
  ContentItem text;
  text.set_id("c2");
  text.set_name("Ticker");
  text.set_type(CONTENT_TYPE_TEXT);
  *text.mutable_text_info() = signage::testing::MakeText("news");
  Stamp(text.mutable_created_at());

  auto valid = signage::schema::ValidateContent(text);
  assert(valid.text_info().font_size() == signage::schema::kDefaultFontSize);
  assert(valid.text_info().scroll_speed() == signage::schema::kDefaultScrollSpeed);
  assert(valid.text_info().scroll_type() == SCROLL_TYPE_NONE);

  auto huge = text;
  huge.mutable_text_info()->set_font_size(500);
  assert(ExpectValidationError([&] { signage::schema::ValidateContent(huge); }) == "textInfo.fontSize");

  auto bad_color = text;
  bad_color.mutable_text_info()->set_color("black");
  assert(ExpectValidationError([&] { signage::schema::ValidateContent(bad_color); }) == "textInfo.color");
}

void TestPayloadMustMatchType() {
  ContentItem item;
  item.set_id("c3");
  item.set_name("Clip");
  item.set_type(CONTENT_TYPE_VIDEO);
  item.mutable_url_info()->set_url("https://example.com");
  Stamp(item.mutable_created_at());
  assert(ExpectValidationError([&] { signage::schema::ValidateContent(item); }) == "fileInfo");

  ContentItem image;
  image.set_id("c4");
  image.set_name("Photo");
  image.set_type(CONTENT_TYPE_IMAGE);
  auto* info = image.mutable_file_info();
  info->set_original_name("photo.png");
  info->set_mime_type("video/mp4");
  info->set_storage_path("contents/files/c4-photo.png");
  Stamp(image.mutable_created_at());
  assert(ExpectValidationError([&] { signage::schema::ValidateContent(image); }) == "fileInfo.mimeType");
}

void TestWeatherDefaultsApiUrl() {
  ContentItem weather;
  weather.set_id("c5");
  weather.set_name("Forecast");
  weather.set_type(CONTENT_TYPE_WEATHER);
  weather.mutable_weather_info()->add_locations("130000");
  weather.mutable_weather_info()->set_weather_type(WEATHER_TYPE_WEEKLY);
  Stamp(weather.mutable_created_at());

  auto valid = signage::schema::ValidateContent(weather);
  assert(valid.weather_info().api_url() == signage::schema::kDefaultWeatherApiUrl);

  weather.mutable_weather_info()->clear_locations();
  assert(ExpectValidationError([&] { signage::schema::ValidateContent(weather); }) == "weatherInfo.locations");
}

void TestYouTubeDetection() {
  assert(signage::schema::IsYouTubeUrl("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
  assert(signage::schema::IsYouTubeUrl("https://youtu.be/dQw4w9WgXcQ"));
  assert(signage::schema::IsYouTubeUrl("youtube.com/watch?v=abc"));
  assert(!signage::schema::IsYouTubeUrl("https://vimeo.com/123"));
  assert(!signage::schema::IsYouTubeUrl("https://www.youtube.com/channel/abc"));
  assert(!signage::schema::IsYouTubeUrl("https://youtu.be/"));
}

void TestScheduleNormalization() {
  auto schedule = signage::testing::MakeSchedule("Morning", "07:30", "p1");
  schedule.set_id("s1");
  schedule.add_weekdays(WEEKDAY_FRIDAY);
  schedule.add_weekdays(WEEKDAY_MONDAY);
  schedule.add_weekdays(WEEKDAY_WEDNESDAY);
  Stamp(schedule.mutable_created_at());

  auto valid = signage::schema::ValidateSchedule(schedule);
  assert(valid.enabled());
  assert(valid.weekdays_size() == 3);
  assert(valid.weekdays(0) == WEEKDAY_MONDAY);
  assert(valid.weekdays(1) == WEEKDAY_WEDNESDAY);
  assert(valid.weekdays(2) == WEEKDAY_FRIDAY);

  auto bad_time = schedule;
  bad_time.set_time("24:00");
  assert(ExpectValidationError([&] { signage::schema::ValidateSchedule(bad_time); }) == "time");

  auto no_days = schedule;
  no_days.clear_weekdays();
  assert(ExpectValidationError([&] { signage::schema::ValidateSchedule(no_days); }) == "weekdays");

  auto no_playlist = schedule;
  no_playlist.mutable_event()->mutable_playlist()->clear_playlist_id();
  assert(ExpectValidationError([&] { signage::schema::ValidateSchedule(no_playlist); }) == "event.playlist.playlistId");
}

void TestLegacyScheduleIndexEntryGetsEveryDay() {
  ScheduleIndexEntry entry;
  entry.set_id("s1");
  entry.set_name("Legacy");
  entry.set_time("06:00");
  entry.set_event_type(SCHEDULE_EVENT_TYPE_POWER_ON);
  Stamp(entry.mutable_created_at());

  auto valid = signage::schema::ValidateScheduleIndexEntry(entry);
  assert(valid.weekdays_size() == 7);
  assert(valid.weekdays(0) == WEEKDAY_MONDAY);
  assert(valid.weekdays(6) == WEEKDAY_SUNDAY);
}

void TestPlaylistDurationsMustReferenceAssignedContent() {
  auto playlist = signage::testing::MakePlaylist("Morning", "l1", "left", {"c1", "c2"});
  playlist.set_id("p1");
  Stamp(playlist.mutable_created_at());
  auto valid = signage::schema::ValidatePlaylist(playlist);
  assert(signage::schema::CountContents(valid) == 2);

  auto stray = playlist;
  auto* duration = stray.mutable_content_assignments(0)->add_content_durations();
  duration->set_content_id("c9");
  duration->set_duration(5);
  assert(ExpectValidationError([&] { signage::schema::ValidatePlaylist(stray); }) == "contentAssignments[0].contentDurations[2].contentId");

  auto layout = StoredLayout();
  signage::schema::ValidatePlaylistAgainstLayout(valid, layout);

  auto other_region = playlist;
  other_region.mutable_content_assignments(0)->set_region_id("center");
  assert(ExpectValidationError([&] { signage::schema::ValidatePlaylistAgainstLayout(other_region, layout); }) ==
         "contentAssignments[0].regionId");
}

} // namespace

int main() {
  TestLayoutDefaultsZIndexToRegionPosition();
  TestLayoutRejectsBadRegions();
  TestValidationIsIdempotent();
  TestTextDefaultsAndRanges();
  TestPayloadMustMatchType();
  TestWeatherDefaultsApiUrl();
  TestYouTubeDetection();
  TestScheduleNormalization();
  TestLegacyScheduleIndexEntryGetsEveryDay();
  TestPlaylistDurationsMustReferenceAssignedContent();

  std::cout << "signage_unit_schema: pass\n";
  return 0;
}
