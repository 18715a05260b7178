#include "reference_guard.hpp"

#include <unordered_set>

#include "internal/util/errors.hpp"

namespace signage::integrity {

ReferenceGuard::ReferenceGuard(UsageCheckerPtr usage, repository::ContentRepositoryPtr contents, repository::LayoutRepositoryPtr layouts,
                               repository::PlaylistRepositoryPtr playlists)
    : usage_(std::move(usage)), contents_(std::move(contents)), layouts_(std::move(layouts)), playlists_(std::move(playlists)) {
}

std::vector<util::BlockingReference> ReferenceGuard::Blocking(const Usage& usage) {
  std::vector<util::BlockingReference> blocking;
  blocking.reserve(usage.playlists.size());
  for (const auto& playlist : usage.playlists) {
    blocking.push_back({playlist.id, playlist.name});
  }
  return blocking;
}

void ReferenceGuard::SafeDeleteContent(const std::string& content_id) {
  auto content = contents_->GetById(content_id);
  if (!content) {
    throw util::NotFound("content not found: " + content_id);
  }

  auto usage = usage_->CheckContentUsage(content_id);
  if (usage.is_used) {
    throw util::ConflictError(UsageChecker::DescribeUsage(usage, "content \"" + content->name() + "\""), Blocking(usage));
  }

  contents_->Delete(content_id);
}

ForcedDeleteReport ReferenceGuard::ForceDeleteContent(const std::string& content_id) {
  if (!contents_->GetById(content_id)) {
    throw util::NotFound("content not found: " + content_id);
  }

  ForcedDeleteReport report;
  for (const auto& playlist : usage_->CheckContentUsage(content_id).playlists) {
    try {
      if (playlists_->StripContentReferences(playlist.id, content_id)) {
        report.updated_playlists.push_back(playlist.id);
      }
    } catch (const util::NotFound&) {
      // playlist deleted since the scan, nothing left to strip
      continue;
    }
  }

  contents_->Delete(content_id);
  return report;
}

void ReferenceGuard::SafeDeleteLayout(const std::string& layout_id) {
  auto layout = layouts_->GetById(layout_id);
  if (!layout) {
    throw util::NotFound("layout not found: " + layout_id);
  }

  auto usage = usage_->CheckLayoutUsage(layout_id);
  if (usage.is_used) {
    throw util::ConflictError(UsageChecker::DescribeUsage(usage, "layout \"" + layout->name() + "\""), Blocking(usage));
  }

  layouts_->Delete(layout_id);
}

void ReferenceGuard::CheckLayoutRegions(const signage::store::v1::Layout& layout) {
  auto usage = usage_->CheckLayoutUsage(layout.id());
  if (!usage.is_used) {
    return;
  }

  std::unordered_set<std::string> region_ids;
  for (const auto& region : layout.regions()) {
    region_ids.insert(region.id());
  }

  Usage blocked;
  for (const auto& reference : usage.playlists) {
    auto playlist = playlists_->GetById(reference.id);
    if (!playlist) continue;

    bool broken = region_ids.empty();
    for (const auto& assignment : playlist->content_assignments()) {
      if (region_ids.count(assignment.region_id()) == 0) broken = true;
    }
    if (broken) {
      blocked.playlists.push_back(reference);
      ++blocked.usage_count;
    }
  }

  if (blocked.playlists.empty()) {
    return;
  }
  blocked.is_used = true;
  throw util::ConflictError(UsageChecker::DescribeUsage(blocked, "a region of layout \"" + layout.name() + "\""), Blocking(blocked));
}

} // namespace signage::integrity
