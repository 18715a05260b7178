#pragma once

#include <google/protobuf/field_mask.pb.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/integrity/reference_guard.hpp"
#include "internal/integrity/usage_checker.hpp"
#include "internal/repository/content_repository.hpp"
#include "service_context.hpp"
#include "signage/store/v1.hpp"

namespace signage::service {

enum class DeleteMode {
  kSafe,    // refuse while referenced
  kForced,  // strip references first
};

/*
  Boundary consumed by the UI and the CLI.

  Every call is logged on failure. ConflictError is rethrown unchanged so
  its message (the blocking playlists) reaches the user; every other
  failure becomes util::OperationFailed("<operation> failed") with the
  original exception nested.
*/
class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  // ------------------------------------------------------------------
  // Content
  // ------------------------------------------------------------------
  std::vector<signage::store::v1::ContentIndexEntry> ListContents();
  std::optional<signage::store::v1::ContentItem>     GetContent(const std::string& id);

  signage::store::v1::ContentItem CreateFileContent(const media::FileUpload& file, const std::string& name = {},
                                                    const std::vector<std::string>& tags = {});
  signage::store::v1::ContentItem CreateFileOrTextContent(const media::FileUpload& file, const std::string& name = {},
                                                          const std::vector<std::string>& tags = {});
  signage::store::v1::ContentItem CreateUrlContent(const std::string& url, const std::string& name = {}, const std::string& title = {},
                                                   const std::string& description = {}, const std::vector<std::string>& tags = {});
  signage::store::v1::ContentItem CreateTextContent(const std::string& name, const signage::store::v1::TextInfo& text,
                                                    const std::vector<std::string>& tags = {});
  signage::store::v1::ContentItem CreateWeatherContent(const std::string& name, const signage::store::v1::WeatherInfo& weather,
                                                       const std::vector<std::string>& tags = {});
  signage::store::v1::ContentItem CreateCsvContent(const repository::CsvContentRequest& request);

  signage::store::v1::ContentItem UpdateContent(const std::string& id, const signage::store::v1::ContentItem& patch,
                                                const google::protobuf::FieldMask& mask, const repository::CsvAssetUpdate& csv = {});

  void DeleteContent(const std::string& id, DeleteMode mode = DeleteMode::kSafe);

  integrity::Usage                                   CheckContentUsage(const std::string& id);
  std::vector<signage::store::v1::ContentIndexEntry> ListUnusedContents();
  std::shared_ptr<arrow::Buffer>                     ReadContentFile(const std::string& storage_path);
  repository::ThumbnailRegenerationReport            RegenerateAllThumbnails();

  // ------------------------------------------------------------------
  // Layouts
  // ------------------------------------------------------------------
  std::vector<signage::store::v1::LayoutIndexEntry> ListLayouts();
  std::optional<signage::store::v1::Layout>         GetLayout(const std::string& id);
  signage::store::v1::Layout                        CreateLayout(const signage::store::v1::Layout& layout);

  // Allowed while playlists use the layout; logs a warning naming them.
  signage::store::v1::Layout UpdateLayout(const std::string& id, const signage::store::v1::Layout& patch, const google::protobuf::FieldMask& mask);

  // Refused with ConflictError while playlists use the layout.
  void DeleteLayout(const std::string& id);

  integrity::Usage CheckLayoutUsage(const std::string& id);

  // ------------------------------------------------------------------
  // Playlists
  // ------------------------------------------------------------------
  std::vector<signage::store::v1::PlaylistIndexEntry> ListPlaylists();
  std::optional<signage::store::v1::Playlist>         GetPlaylist(const std::string& id);
  signage::store::v1::Playlist                        CreatePlaylist(const signage::store::v1::Playlist& playlist);
  signage::store::v1::Playlist UpdatePlaylist(const std::string& id, const signage::store::v1::Playlist& patch, const google::protobuf::FieldMask& mask);

  // Allowed while schedules trigger the playlist; logs a warning naming them.
  void DeletePlaylist(const std::string& id);

  integrity::PlaylistUsage CheckPlaylistUsage(const std::string& id);

  // ------------------------------------------------------------------
  // Schedules
  // ------------------------------------------------------------------
  std::vector<signage::store::v1::ScheduleIndexEntry> ListSchedules();
  std::optional<signage::store::v1::ScheduleItem>     GetSchedule(const std::string& id);
  signage::store::v1::ScheduleItem                    CreateSchedule(const signage::store::v1::ScheduleItem& schedule);
  signage::store::v1::ScheduleItem UpdateSchedule(const std::string& id, const signage::store::v1::ScheduleItem& patch,
                                                  const google::protobuf::FieldMask& mask);
  void DeleteSchedule(const std::string& id);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  // Reconcile every entity family; keyed by directory name.
  std::map<std::string, repository::ReconcileReport> ReconcileAll();

 private:
  void WarnIfThumbnailMissing(const signage::store::v1::ContentItem& item);

  ServiceContext ctx_;
};

} // namespace signage::service
