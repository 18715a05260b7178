#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/integrity/usage_checker.hpp"
#include "internal/repository/content_repository.hpp"
#include "internal/repository/layout_repository.hpp"
#include "internal/repository/playlist_repository.hpp"

namespace signage::integrity {

struct ForcedDeleteReport {
  // playlists rewritten without the content
  std::vector<std::string> updated_playlists;
};

/*
  Deletes gated by references.

  Safe deletes refuse with util::ConflictError listing the referencing
  playlists. The forced content delete first rewrites every referencing
  playlist without the content, persisting each, and only then deletes
  the content record.

  The usage scan and the delete are separate steps with no lock spanning
  both: a playlist written in between can reference the record after the
  scan passed, leaving a dangling id.
*/
class ReferenceGuard {
 public:
  ReferenceGuard(UsageCheckerPtr usage, repository::ContentRepositoryPtr contents, repository::LayoutRepositoryPtr layouts,
                 repository::PlaylistRepositoryPtr playlists);

  void SafeDeleteContent(const std::string& content_id);

  ForcedDeleteReport ForceDeleteContent(const std::string& content_id);

  void SafeDeleteLayout(const std::string& layout_id);

  /*
    Refuses with util::ConflictError when a playlist on this layout
    assigns a region the layout no longer has, or when a used layout has
    no regions left. Renames and geometry changes pass.
  */
  void CheckLayoutRegions(const signage::store::v1::Layout& layout);

 private:
  static std::vector<util::BlockingReference> Blocking(const Usage& usage);

  UsageCheckerPtr                   usage_;
  repository::ContentRepositoryPtr  contents_;
  repository::LayoutRepositoryPtr   layouts_;
  repository::PlaylistRepositoryPtr playlists_;
};

using ReferenceGuardPtr = std::shared_ptr<ReferenceGuard>;

} // namespace signage::integrity
