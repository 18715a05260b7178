#include "usage_checker.hpp"

#include <algorithm>
#include <sstream>

namespace signage::integrity {

using namespace signage::store::v1;

UsageChecker::UsageChecker(repository::ContentRepositoryPtr contents, repository::PlaylistRepositoryPtr playlists,
                           repository::ScheduleRepositoryPtr schedules)
    : contents_(std::move(contents)), playlists_(std::move(playlists)), schedules_(std::move(schedules)) {
}

Usage UsageChecker::CheckContentUsage(const std::string& content_id) {
  Usage usage;

  for (const auto& entry : playlists_->ListIndex()) {
    // ghost entries resolve to nothing and reference nothing
    auto playlist = playlists_->GetById(entry.id());
    if (!playlist) continue;

    int occurrences = 0;
    for (const auto& assignment : playlist->content_assignments()) {
      occurrences += static_cast<int>(std::count(assignment.content_ids().begin(), assignment.content_ids().end(), content_id));
    }
    if (occurrences == 0) continue;

    usage.playlists.push_back({playlist->id(), playlist->name(), playlist->device(), occurrences});
    usage.usage_count += occurrences;
  }

  usage.is_used = !usage.playlists.empty();
  return usage;
}

Usage UsageChecker::CheckLayoutUsage(const std::string& layout_id) {
  Usage usage;

  for (const auto& entry : playlists_->ListIndex()) {
    if (entry.layout_id() != layout_id) continue;
    usage.playlists.push_back({entry.id(), entry.name(), entry.device(), 1});
    ++usage.usage_count;
  }

  usage.is_used = !usage.playlists.empty();
  return usage;
}

PlaylistUsage UsageChecker::CheckPlaylistUsage(const std::string& playlist_id) {
  PlaylistUsage usage;
  for (const auto& entry : schedules_->ListByPlaylist(playlist_id)) {
    usage.schedules.push_back({entry.id(), entry.name(), entry.time()});
  }
  usage.is_used = !usage.schedules.empty();
  return usage;
}

std::unordered_set<std::string> UsageChecker::UsedContentIds() {
  std::unordered_set<std::string> used;
  for (const auto& entry : playlists_->ListIndex()) {
    auto playlist = playlists_->GetById(entry.id());
    if (!playlist) continue;
    for (const auto& assignment : playlist->content_assignments()) {
      used.insert(assignment.content_ids().begin(), assignment.content_ids().end());
    }
  }
  return used;
}

std::vector<ContentIndexEntry> UsageChecker::UnusedContents() {
  const auto used = UsedContentIds();

  std::vector<ContentIndexEntry> unused;
  for (auto& entry : contents_->ListIndex()) {
    if (used.count(entry.id()) == 0) {
      unused.push_back(std::move(entry));
    }
  }
  return unused;
}

std::string UsageChecker::DescribeUsage(const Usage& usage, const std::string& subject) {
  if (!usage.is_used) {
    return {};
  }

  std::ostringstream names;
  for (size_t i = 0; i < usage.playlists.size(); ++i) {
    if (i > 0) names << ", ";
    names << '"' << usage.playlists[i].name << '"';
  }

  std::ostringstream out;
  if (usage.playlists.size() == 1) {
    out << subject << " is used by playlist " << names.str();
  } else {
    out << subject << " is used by " << usage.playlists.size() << " playlists (" << names.str() << ")";
  }
  return out.str();
}

} // namespace signage::integrity
