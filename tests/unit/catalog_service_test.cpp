#include "internal/service/catalog_service.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace signage::store::v1;
using signage::service::DeleteMode;

signage::factory::Application BuildApp() {
  return signage::factory::BuildWithStore(signage::testing::MemoryStore());
}

// True when fn throws OperationFailed(expected_message) wrapping an Inner.
template <typename Inner, typename Fn>
bool FailsWithNested(Fn&& fn, const std::string& expected_message) {
  try {
    fn();
  } catch (const signage::util::OperationFailed& outer) {
    assert(std::string(outer.what()) == expected_message);
    try {
      std::rethrow_if_nested(outer);
    } catch (const Inner&) {
      return true;
    } catch (const std::exception&) {
      return false;
    }
  }
  return false;
}

void TestFailuresAreWrappedWithCause() {
  auto app = BuildApp();

  assert(FailsWithNested<signage::util::NotFound>([&] { app.catalog->DeleteSchedule("missing"); }, "CatalogService.DeleteSchedule failed"));

  auto bad_layout = signage::testing::MakeLayout("", {"main"});
  assert(FailsWithNested<signage::util::ValidationError>([&] { app.catalog->CreateLayout(bad_layout); }, "CatalogService.CreateLayout failed"));
}

void TestConflictsPassThroughUnwrapped() {
  auto app     = BuildApp();
  auto layout  = app.catalog->CreateLayout(signage::testing::MakeLayout("Full", {"main"}));
  auto content = app.catalog->CreateTextContent("Welcome", signage::testing::MakeText("hello"));
  app.catalog->CreatePlaylist(signage::testing::MakePlaylist("Lobby", layout.id(), "main", {content.id()}));

  bool conflict = false;
  try {
    app.catalog->DeleteContent(content.id());
  } catch (const signage::util::ConflictError& e) {
    conflict = true;
    assert(e.blocking().size() == 1);
  }
  assert(conflict);

  conflict = false;
  try {
    app.catalog->DeleteLayout(layout.id());
  } catch (const signage::util::ConflictError&) {
    conflict = true;
  }
  assert(conflict && "layouts in use cannot be deleted");

  app.catalog->DeleteContent(content.id(), DeleteMode::kForced);
  assert(!app.catalog->GetContent(content.id()).has_value());
  assert(app.catalog->ListUnusedContents().empty());
}

void TestPlaylistDeleteProceedsDespiteSchedules() {
  auto app      = BuildApp();
  auto layout   = app.catalog->CreateLayout(signage::testing::MakeLayout("Full", {"main"}));
  auto playlist = app.catalog->CreatePlaylist(signage::testing::MakePlaylist("Lobby", layout.id(), "main", {}));
  app.catalog->CreateSchedule(signage::testing::MakeSchedule("Morning", "08:00", playlist.id()));

  assert(app.catalog->CheckPlaylistUsage(playlist.id()).is_used);
  app.catalog->DeletePlaylist(playlist.id());
  assert(!app.catalog->GetPlaylist(playlist.id()).has_value());
  assert(app.catalog->ListSchedules().size() == 1);

  // layout is free again
  app.catalog->DeleteLayout(layout.id());
  assert(app.catalog->ListLayouts().empty());
}

void TestUpdateOfUsedLayoutIsAllowed() {
  auto app    = BuildApp();
  auto layout = app.catalog->CreateLayout(signage::testing::MakeLayout("Full", {"main"}));
  app.catalog->CreatePlaylist(signage::testing::MakePlaylist("Lobby", layout.id(), "main", {}));

  Layout patch;
  patch.set_name("Full screen");
  google::protobuf::FieldMask mask;
  mask.add_paths("name");
  auto updated = app.catalog->UpdateLayout(layout.id(), patch, mask);
  assert(updated.name() == "Full screen");
  assert(app.catalog->CheckLayoutUsage(layout.id()).is_used);
}

void TestLayoutUpdateCannotDropAssignedRegion() {
  auto app     = BuildApp();
  auto layout  = app.catalog->CreateLayout(signage::testing::MakeLayout("Split", {"main", "side"}));
  auto content = app.catalog->CreateTextContent("Ticker", signage::testing::MakeText("news"));
  auto lobby   = app.catalog->CreatePlaylist(signage::testing::MakePlaylist("Lobby", layout.id(), "side", {content.id()}));

  google::protobuf::FieldMask mask;
  mask.add_paths("regions");

  Layout only_main = signage::testing::MakeLayout("Split", {"main"});
  bool   conflict  = false;
  try {
    app.catalog->UpdateLayout(layout.id(), only_main, mask);
  } catch (const signage::util::ConflictError& e) {
    conflict = true;
    assert(e.blocking().size() == 1 && e.blocking()[0].id == lobby.id());
  }
  assert(conflict);
  assert(app.catalog->GetLayout(layout.id())->regions_size() == 2);

  conflict = false;
  try {
    app.catalog->UpdateLayout(layout.id(), Layout(), mask);
  } catch (const signage::util::ConflictError&) {
    conflict = true;
  }
  assert(conflict && "a used layout keeps at least one region");

  // dropping a region nobody assigns is fine
  Layout only_side = signage::testing::MakeLayout("Split", {"side"});
  assert(app.catalog->UpdateLayout(layout.id(), only_side, mask).regions_size() == 1);

  // the playlist stays writable
  app.catalog->DeleteContent(content.id(), DeleteMode::kForced);
  assert(app.catalog->GetPlaylist(lobby.id())->content_assignments(0).content_ids_size() == 0);
}

void TestReconcileCoversEveryDirectory() {
  auto app = BuildApp();
  app.catalog->CreateTextContent("Note", signage::testing::MakeText("hi"));

  auto reports = app.catalog->ReconcileAll();
  assert(reports.size() == 4);
  assert(reports.count("contents") && reports.count("layouts") && reports.count("playlists") && reports.count("schedules"));
  assert(reports["contents"].ghosts_pruned == 0 && reports["contents"].orphans_indexed == 0);
}

} // namespace

int main() {
  TestFailuresAreWrappedWithCause();
  TestConflictsPassThroughUnwrapped();
  TestPlaylistDeleteProceedsDespiteSchedules();
  TestUpdateOfUsedLayoutIsAllowed();
  TestLayoutUpdateCannotDropAssignedRegion();
  TestReconcileCoversEveryDirectory();

  std::cout << "signage_unit_catalog_service: pass\n";
  return 0;
}
