#include "internal/repository/playlist_repository.hpp"

#include <google/protobuf/util/field_mask_util.h>

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/repository/layout_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace signage::store::v1;
using signage::repository::LayoutRepository;
using signage::repository::PlaylistRepository;

struct Fixture {
  signage::storage::VirtualStorePtr     store     = signage::testing::MemoryStore();
  signage::lock::ResourceLockManagerPtr locks     = std::make_shared<signage::lock::ResourceLockManager>();
  std::shared_ptr<LayoutRepository>     layouts   = std::make_shared<LayoutRepository>(store, locks);
  std::shared_ptr<PlaylistRepository>   playlists = std::make_shared<PlaylistRepository>(store, locks, layouts);
};

std::string ExpectValidationField(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const signage::util::ValidationError& e) {
    return e.field();
  }
  assert(false && "expected ValidationError");
  return {};
}

void TestCreateRequiresExistingLayout() {
  Fixture f;
  auto    playlist = signage::testing::MakePlaylist("Morning", "no-such-layout", "main", {"c1"});
  assert(ExpectValidationField([&] { f.playlists->Create(playlist); }) == "layoutId");
  assert(f.playlists->ListIndex().empty());
}

void TestAssignmentsMustUseLayoutRegions() {
  Fixture f;
  auto    layout = f.layouts->Create(signage::testing::MakeLayout("Split", {"left", "right"}));

  auto wrong_region = signage::testing::MakePlaylist("Morning", layout.id(), "center", {"c1"});
  assert(ExpectValidationField([&] { f.playlists->Create(wrong_region); }) == "contentAssignments[0].regionId");

  auto empty_layout = f.layouts->Create(signage::testing::MakeLayout("Empty", {}));
  auto on_empty     = signage::testing::MakePlaylist("Nothing", empty_layout.id(), "left", {});
  on_empty.clear_content_assignments();
  assert(ExpectValidationField([&] { f.playlists->Create(on_empty); }) == "layoutId");
}

void TestIndexSummarizesContentCount() {
  Fixture f;
  auto    layout   = f.layouts->Create(signage::testing::MakeLayout("Split", {"left", "right"}));
  auto    playlist = signage::testing::MakePlaylist("Morning", layout.id(), "left", {"c1", "c2"});
  auto*   right    = playlist.add_content_assignments();
  right->set_region_id("right");
  right->add_content_ids("c3");

  auto created = f.playlists->Create(playlist);
  auto entries = f.playlists->ListIndex();
  assert(entries.size() == 1);
  assert(entries[0].id() == created.id());
  assert(entries[0].content_count() == 3);
  assert(entries[0].layout_id() == layout.id());
  assert(entries[0].device() == "lobby-display");
}

void TestPlaylistMayReferenceMissingContent() {
  Fixture f;
  auto    layout  = f.layouts->Create(signage::testing::MakeLayout("Full", {"main"}));
  auto    created = f.playlists->Create(signage::testing::MakePlaylist("Dangling", layout.id(), "main", {"never-created"}));

  auto read = f.playlists->GetById(created.id());
  assert(read.has_value());
  assert(read->content_assignments(0).content_ids(0) == "never-created");
}

void TestStripContentReferencesRemovesIdsAndDurations() {
  Fixture f;
  auto    layout  = f.layouts->Create(signage::testing::MakeLayout("Full", {"main"}));
  auto    loop    = signage::testing::MakePlaylist("Loop", layout.id(), "main", {"c1", "c2"});
  loop.mutable_content_assignments(0)->add_content_ids("c1");
  auto created = f.playlists->Create(loop);

  assert(f.playlists->StripContentReferences(created.id(), "c1"));

  auto read = f.playlists->GetById(created.id());
  assert(read.has_value());
  const auto& assignment = read->content_assignments(0);
  assert(assignment.content_ids_size() == 1 && assignment.content_ids(0) == "c2");
  for (const auto& duration : assignment.content_durations()) {
    assert(duration.content_id() != "c1");
  }
  assert(f.playlists->ListIndex()[0].content_count() == 1);

  // nothing left to strip
  assert(!f.playlists->StripContentReferences(created.id(), "c1"));

  bool threw = false;
  try {
    f.playlists->StripContentReferences("missing", "c1");
  } catch (const signage::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUpdateReplacesAssignments() {
  Fixture f;
  auto    layout  = f.layouts->Create(signage::testing::MakeLayout("Full", {"main"}));
  auto    created = f.playlists->Create(signage::testing::MakePlaylist("Loop", layout.id(), "main", {"c1", "c2"}));

  auto patch = signage::testing::MakePlaylist("", layout.id(), "main", {"c9"});

  google::protobuf::FieldMask mask;
  mask.add_paths("content_assignments");
  auto updated = f.playlists->Update(created.id(), patch, mask);

  assert(updated.name() == "Loop");
  assert(updated.content_assignments_size() == 1);
  assert(updated.content_assignments(0).content_ids_size() == 1);
  assert(updated.content_assignments(0).content_ids(0) == "c9");
}

} // namespace

int main() {
  TestCreateRequiresExistingLayout();
  TestAssignmentsMustUseLayoutRegions();
  TestIndexSummarizesContentCount();
  TestPlaylistMayReferenceMissingContent();
  TestStripContentReferencesRemovesIdsAndDurations();
  TestUpdateReplacesAssignments();

  std::cout << "signage_unit_playlist_repository: pass\n";
  return 0;
}
