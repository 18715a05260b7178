#include "catalog_service.hpp"

#include <exception>
#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/repository/layout_repository.hpp"
#include "internal/repository/playlist_repository.hpp"
#include "internal/repository/schedule_repository.hpp"
#include "internal/util/errors.hpp"

namespace signage::service {

using namespace signage::store::v1;
using signage::observability::IntField;
using signage::observability::StringField;

namespace {

template <typename Fn>
auto ObserveOp(std::string_view route, std::string_view id, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      SIGNAGE_LOG_DEBUG("operation completed", {StringField("route", route), StringField("id", id)});
      return;
    } else {
      auto result = fn();
      SIGNAGE_LOG_DEBUG("operation completed", {StringField("route", route), StringField("id", id)});
      return result;
    }
  } catch (const util::ConflictError& ex) {
    SIGNAGE_LOG_WARN("operation refused",
                     {StringField("route", route), StringField("id", id), StringField("error", ex.what()),
                      IntField("blocking", static_cast<std::int64_t>(ex.blocking().size()))});
    throw;
  } catch (const std::exception& ex) {
    SIGNAGE_LOG_ERROR("operation failed", {StringField("route", route), StringField("id", id), StringField("error", ex.what())});
    std::throw_with_nested(util::OperationFailed(std::string(route) + " failed"));
  }
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.contents || !ctx_.layouts || !ctx_.playlists || !ctx_.schedules || !ctx_.usage || !ctx_.references) {
    throw std::invalid_argument("catalog service: incomplete service context");
  }
}

void CatalogService::WarnIfThumbnailMissing(const ContentItem& item) {
  if (item.type() != CONTENT_TYPE_VIDEO && item.type() != CONTENT_TYPE_IMAGE) return;
  if (!item.file_info().thumbnail_path().empty()) return;
  SIGNAGE_LOG_WARN("content stored without thumbnail", {StringField("content_id", item.id()), StringField("name", item.name())});
}

// ------------------------------------------------------------------
// Content
// ------------------------------------------------------------------

std::vector<ContentIndexEntry> CatalogService::ListContents() {
  return ObserveOp("CatalogService.ListContents", "", [&] { return ctx_.contents->ListIndex(); });
}

std::optional<ContentItem> CatalogService::GetContent(const std::string& id) {
  return ObserveOp("CatalogService.GetContent", id, [&] { return ctx_.contents->GetById(id); });
}

ContentItem CatalogService::CreateFileContent(const media::FileUpload& file, const std::string& name, const std::vector<std::string>& tags) {
  return ObserveOp("CatalogService.CreateFileContent", "", [&] {
    auto item = ctx_.contents->CreateFileContent(file, name, tags);
    WarnIfThumbnailMissing(item);
    return item;
  });
}

ContentItem CatalogService::CreateFileOrTextContent(const media::FileUpload& file, const std::string& name, const std::vector<std::string>& tags) {
  return ObserveOp("CatalogService.CreateFileOrTextContent", "", [&] {
    auto item = ctx_.contents->CreateFileOrTextContent(file, name, tags);
    WarnIfThumbnailMissing(item);
    return item;
  });
}

ContentItem CatalogService::CreateUrlContent(const std::string& url, const std::string& name, const std::string& title,
                                             const std::string& description, const std::vector<std::string>& tags) {
  return ObserveOp("CatalogService.CreateUrlContent", "", [&] { return ctx_.contents->CreateUrlContent(url, name, title, description, tags); });
}

ContentItem CatalogService::CreateTextContent(const std::string& name, const TextInfo& text, const std::vector<std::string>& tags) {
  return ObserveOp("CatalogService.CreateTextContent", "", [&] { return ctx_.contents->CreateTextContent(name, text, tags); });
}

ContentItem CatalogService::CreateWeatherContent(const std::string& name, const WeatherInfo& weather, const std::vector<std::string>& tags) {
  return ObserveOp("CatalogService.CreateWeatherContent", "", [&] { return ctx_.contents->CreateWeatherContent(name, weather, tags); });
}

ContentItem CatalogService::CreateCsvContent(const repository::CsvContentRequest& request) {
  return ObserveOp("CatalogService.CreateCsvContent", "", [&] { return ctx_.contents->CreateCsvContent(request); });
}

ContentItem CatalogService::UpdateContent(const std::string& id, const ContentItem& patch, const google::protobuf::FieldMask& mask,
                                          const repository::CsvAssetUpdate& csv) {
  return ObserveOp("CatalogService.UpdateContent", id, [&] { return ctx_.contents->UpdateContent(id, patch, mask, csv); });
}

void CatalogService::DeleteContent(const std::string& id, DeleteMode mode) {
  ObserveOp("CatalogService.DeleteContent", id, [&] {
    if (mode == DeleteMode::kSafe) {
      ctx_.references->SafeDeleteContent(id);
      return;
    }
    auto report = ctx_.references->ForceDeleteContent(id);
    SIGNAGE_LOG_INFO("content force deleted",
                     {StringField("content_id", id), IntField("updated_playlists", static_cast<std::int64_t>(report.updated_playlists.size()))});
  });
}

integrity::Usage CatalogService::CheckContentUsage(const std::string& id) {
  return ObserveOp("CatalogService.CheckContentUsage", id, [&] { return ctx_.usage->CheckContentUsage(id); });
}

std::vector<ContentIndexEntry> CatalogService::ListUnusedContents() {
  return ObserveOp("CatalogService.ListUnusedContents", "", [&] { return ctx_.usage->UnusedContents(); });
}

std::shared_ptr<arrow::Buffer> CatalogService::ReadContentFile(const std::string& storage_path) {
  return ObserveOp("CatalogService.ReadContentFile", storage_path, [&] { return ctx_.contents->ReadFile(storage_path); });
}

repository::ThumbnailRegenerationReport CatalogService::RegenerateAllThumbnails() {
  return ObserveOp("CatalogService.RegenerateAllThumbnails", "", [&] {
    auto report = ctx_.contents->RegenerateAllThumbnails();
    SIGNAGE_LOG_INFO("thumbnails regenerated", {IntField("total", static_cast<std::int64_t>(report.total)),
                                                IntField("success", static_cast<std::int64_t>(report.success)),
                                                IntField("failed", static_cast<std::int64_t>(report.failed.size()))});
    return report;
  });
}

// ------------------------------------------------------------------
// Layouts
// ------------------------------------------------------------------

std::vector<LayoutIndexEntry> CatalogService::ListLayouts() {
  return ObserveOp("CatalogService.ListLayouts", "", [&] { return ctx_.layouts->ListIndex(); });
}

std::optional<Layout> CatalogService::GetLayout(const std::string& id) {
  return ObserveOp("CatalogService.GetLayout", id, [&] { return ctx_.layouts->GetById(id); });
}

Layout CatalogService::CreateLayout(const Layout& layout) {
  return ObserveOp("CatalogService.CreateLayout", "", [&] { return ctx_.layouts->Create(layout); });
}

Layout CatalogService::UpdateLayout(const std::string& id, const Layout& patch, const google::protobuf::FieldMask& mask) {
  return ObserveOp("CatalogService.UpdateLayout", id, [&] {
    auto usage = ctx_.usage->CheckLayoutUsage(id);
    if (usage.is_used) {
      SIGNAGE_LOG_WARN("updating layout in use", {StringField("layout_id", id),
                                                  StringField("usage", integrity::UsageChecker::DescribeUsage(usage, "layout"))});
    }
    return ctx_.layouts->Update(id, patch, mask);
  });
}

void CatalogService::DeleteLayout(const std::string& id) {
  ObserveOp("CatalogService.DeleteLayout", id, [&] { ctx_.references->SafeDeleteLayout(id); });
}

integrity::Usage CatalogService::CheckLayoutUsage(const std::string& id) {
  return ObserveOp("CatalogService.CheckLayoutUsage", id, [&] { return ctx_.usage->CheckLayoutUsage(id); });
}

// ------------------------------------------------------------------
// Playlists
// ------------------------------------------------------------------

std::vector<PlaylistIndexEntry> CatalogService::ListPlaylists() {
  return ObserveOp("CatalogService.ListPlaylists", "", [&] { return ctx_.playlists->ListIndex(); });
}

std::optional<Playlist> CatalogService::GetPlaylist(const std::string& id) {
  return ObserveOp("CatalogService.GetPlaylist", id, [&] { return ctx_.playlists->GetById(id); });
}

Playlist CatalogService::CreatePlaylist(const Playlist& playlist) {
  return ObserveOp("CatalogService.CreatePlaylist", "", [&] { return ctx_.playlists->Create(playlist); });
}

Playlist CatalogService::UpdatePlaylist(const std::string& id, const Playlist& patch, const google::protobuf::FieldMask& mask) {
  return ObserveOp("CatalogService.UpdatePlaylist", id, [&] { return ctx_.playlists->Update(id, patch, mask); });
}

void CatalogService::DeletePlaylist(const std::string& id) {
  ObserveOp("CatalogService.DeletePlaylist", id, [&] {
    auto usage = ctx_.usage->CheckPlaylistUsage(id);
    if (usage.is_used) {
      SIGNAGE_LOG_WARN("deleting playlist still triggered by schedules",
                       {StringField("playlist_id", id), IntField("schedules", static_cast<std::int64_t>(usage.schedules.size()))});
    }
    ctx_.playlists->Delete(id);
  });
}

integrity::PlaylistUsage CatalogService::CheckPlaylistUsage(const std::string& id) {
  return ObserveOp("CatalogService.CheckPlaylistUsage", id, [&] { return ctx_.usage->CheckPlaylistUsage(id); });
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

std::vector<ScheduleIndexEntry> CatalogService::ListSchedules() {
  return ObserveOp("CatalogService.ListSchedules", "", [&] { return ctx_.schedules->ListIndex(); });
}

std::optional<ScheduleItem> CatalogService::GetSchedule(const std::string& id) {
  return ObserveOp("CatalogService.GetSchedule", id, [&] { return ctx_.schedules->GetById(id); });
}

ScheduleItem CatalogService::CreateSchedule(const ScheduleItem& schedule) {
  return ObserveOp("CatalogService.CreateSchedule", "", [&] { return ctx_.schedules->Create(schedule); });
}

ScheduleItem CatalogService::UpdateSchedule(const std::string& id, const ScheduleItem& patch, const google::protobuf::FieldMask& mask) {
  return ObserveOp("CatalogService.UpdateSchedule", id, [&] { return ctx_.schedules->Update(id, patch, mask); });
}

void CatalogService::DeleteSchedule(const std::string& id) {
  ObserveOp("CatalogService.DeleteSchedule", id, [&] { ctx_.schedules->Delete(id); });
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

std::map<std::string, repository::ReconcileReport> CatalogService::ReconcileAll() {
  return ObserveOp("CatalogService.ReconcileAll", "", [&] {
    std::map<std::string, repository::ReconcileReport> reports;
    reports[repository::ContentTraits::kDirectory]  = ctx_.contents->Reconcile();
    reports[repository::LayoutTraits::kDirectory]   = ctx_.layouts->Reconcile();
    reports[repository::PlaylistTraits::kDirectory] = ctx_.playlists->Reconcile();
    reports[repository::ScheduleTraits::kDirectory] = ctx_.schedules->Reconcile();
    for (const auto& [dir, report] : reports) {
      if (report.ghosts_pruned == 0 && report.orphans_indexed == 0 && report.invalid_details.empty()) continue;
      SIGNAGE_LOG_INFO("index reconciled", {StringField("directory", dir), IntField("ghosts_pruned", static_cast<std::int64_t>(report.ghosts_pruned)),
                                            IntField("orphans_indexed", static_cast<std::int64_t>(report.orphans_indexed)),
                                            IntField("invalid_details", static_cast<std::int64_t>(report.invalid_details.size()))});
    }
    return reports;
  });
}

} // namespace signage::service
