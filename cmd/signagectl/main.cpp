#include <arrow/io/file.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/field_mask_util.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/json_codec.hpp"
#include "internal/util/errors.hpp"
#include "signage/store/v1.hpp"

using namespace signage::store::v1;
using signage::service::CatalogService;
using signage::storage::common::EncodeJson;

static void Usage() {
  std::cout << "Usage:\n"
            << "  signagectl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "  list <content|layout|playlist|schedule>\n"
            << "  get <content|layout|playlist|schedule> <id>\n"
            << "  create <layout|playlist|schedule> <json|@file>\n"
            << "  update <content|layout|playlist|schedule> <id> <json|@file>\n"
            << "  delete <content|layout|playlist|schedule> <id> [--force]\n"
            << "  upload <path> [name]\n"
            << "  add-url <url> [name]\n"
            << "  add-text <name> <text>\n"
            << "  add-weather <name> <location> [location...]\n"
            << "  usage <content|layout|playlist> <id>\n"
            << "  unused\n"
            << "  reconcile\n"
            << "  regenerate-thumbnails\n";
}

static void PrintException(const std::exception& e, int depth = 0) {
  std::cerr << std::string(depth * 2, ' ') << e.what() << "\n";
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    PrintException(nested, depth + 1);
  }
}

static std::shared_ptr<arrow::Buffer> ReadLocalFile(const std::string& path) {
  auto file = signage::storage::common::Unwrap(arrow::io::ReadableFile::Open(path), "open " + path);
  return signage::storage::common::ReadAll(file, "read " + path);
}

// "@path" reads the JSON from a file, anything else is the JSON itself.
static std::string JsonArgument(const std::string& arg) {
  if (arg.size() > 1 && arg[0] == '@') {
    auto buffer = ReadLocalFile(arg.substr(1));
    return buffer->ToString();
  }
  return arg;
}

template <typename Message>
static Message ParseJson(const std::string& json) {
  Message msg;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &msg);
  if (!status.ok()) {
    throw signage::util::ValidationError("json", std::string(status.message()));
  }
  return msg;
}

/*
  The update mask is the set of top-level keys present in the JSON patch.
*/
static google::protobuf::FieldMask MaskFromJson(const std::string& json) {
  auto        fields = ParseJson<google::protobuf::Struct>(json);
  std::string paths;
  for (const auto& [key, value] : fields.fields()) {
    if (!paths.empty()) paths += ',';
    paths += key;
  }
  google::protobuf::FieldMask mask;
  if (!google::protobuf::util::FieldMaskUtil::FromJsonString(paths, &mask)) {
    throw signage::util::ValidationError("mask", "invalid field names: " + paths);
  }
  return mask;
}

static std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string GuessMimeType(const std::string& path) {
  const auto dot = path.rfind('.');
  if (dot == std::string::npos) return "application/octet-stream";
  const auto ext = Lowercase(path.substr(dot + 1));
  if (ext == "mp4") return "video/mp4";
  if (ext == "webm") return "video/webm";
  if (ext == "mov") return "video/quicktime";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "gif") return "image/gif";
  if (ext == "webp") return "image/webp";
  if (ext == "txt" || ext == "md") return "text/plain";
  if (ext == "csv") return "text/csv";
  return "application/octet-stream";
}

static std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

template <typename Message>
static int PrintRecord(const std::optional<Message>& record, const std::string& id) {
  if (!record) {
    std::cerr << "not found: " << id << "\n";
    return 4;
  }
  std::cout << EncodeJson(*record) << "\n";
  return 0;
}

template <typename IndexFile, typename Entries>
static int PrintIndex(const Entries& entries) {
  IndexFile index;
  for (const auto& entry : entries) {
    *index.add_entries() = entry;
  }
  std::cout << EncodeJson(index) << "\n";
  return 0;
}

static void PrintUsage(const signage::integrity::Usage& usage) {
  std::cout << "used=" << (usage.is_used ? "true" : "false") << "\n";
  std::cout << "count=" << usage.usage_count << "\n";
  for (const auto& playlist : usage.playlists) {
    std::cout << "playlist=" << playlist.id << " name=\"" << playlist.name << "\" regions=" << playlist.region_count << "\n";
  }
}

static int Dispatch(CatalogService& catalog, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (args.size() < 2) return 1;
    const auto& entity = args[1];
    if (entity == "content") return PrintIndex<ContentIndex>(catalog.ListContents());
    if (entity == "layout") return PrintIndex<LayoutIndex>(catalog.ListLayouts());
    if (entity == "playlist") return PrintIndex<PlaylistIndex>(catalog.ListPlaylists());
    if (entity == "schedule") return PrintIndex<ScheduleIndex>(catalog.ListSchedules());
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (args.size() < 3) return 1;
    const auto& entity = args[1];
    const auto& id     = args[2];
    if (entity == "content") return PrintRecord(catalog.GetContent(id), id);
    if (entity == "layout") return PrintRecord(catalog.GetLayout(id), id);
    if (entity == "playlist") return PrintRecord(catalog.GetPlaylist(id), id);
    if (entity == "schedule") return PrintRecord(catalog.GetSchedule(id), id);
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (args.size() < 3) return 1;
    const auto& entity = args[1];
    const auto  json   = JsonArgument(args[2]);
    if (entity == "layout") {
      std::cout << EncodeJson(catalog.CreateLayout(ParseJson<Layout>(json))) << "\n";
      return 0;
    }
    if (entity == "playlist") {
      std::cout << EncodeJson(catalog.CreatePlaylist(ParseJson<Playlist>(json))) << "\n";
      return 0;
    }
    if (entity == "schedule") {
      std::cout << EncodeJson(catalog.CreateSchedule(ParseJson<ScheduleItem>(json))) << "\n";
      return 0;
    }
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (args.size() < 4) return 1;
    const auto& entity = args[1];
    const auto& id     = args[2];
    const auto  json   = JsonArgument(args[3]);
    const auto  mask   = MaskFromJson(json);
    if (entity == "content") {
      std::cout << EncodeJson(catalog.UpdateContent(id, ParseJson<ContentItem>(json), mask)) << "\n";
      return 0;
    }
    if (entity == "layout") {
      std::cout << EncodeJson(catalog.UpdateLayout(id, ParseJson<Layout>(json), mask)) << "\n";
      return 0;
    }
    if (entity == "playlist") {
      std::cout << EncodeJson(catalog.UpdatePlaylist(id, ParseJson<Playlist>(json), mask)) << "\n";
      return 0;
    }
    if (entity == "schedule") {
      std::cout << EncodeJson(catalog.UpdateSchedule(id, ParseJson<ScheduleItem>(json), mask)) << "\n";
      return 0;
    }
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (args.size() < 3) return 1;
    const auto& entity = args[1];
    const auto& id     = args[2];
    const bool  force  = args.size() >= 4 && args[3] == "--force";
    if (entity == "content") {
      catalog.DeleteContent(id, force ? signage::service::DeleteMode::kForced : signage::service::DeleteMode::kSafe);
    } else if (entity == "layout") {
      catalog.DeleteLayout(id);
    } else if (entity == "playlist") {
      catalog.DeletePlaylist(id);
    } else if (entity == "schedule") {
      catalog.DeleteSchedule(id);
    } else {
      return 1;
    }
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (args.size() < 2) return 1;
    signage::media::FileUpload file;
    file.name      = BaseName(args[1]);
    file.mime_type = GuessMimeType(args[1]);
    file.data      = ReadLocalFile(args[1]);
    std::cout << EncodeJson(catalog.CreateFileOrTextContent(file, args.size() >= 3 ? args[2] : std::string())) << "\n";
    return 0;
  }

  if (cmd == "add-url") {
    if (args.size() < 2) return 1;
    std::cout << EncodeJson(catalog.CreateUrlContent(args[1], args.size() >= 3 ? args[2] : std::string())) << "\n";
    return 0;
  }

  if (cmd == "add-text") {
    if (args.size() < 3) return 1;
    TextInfo text;
    text.set_content(args[2]);
    text.set_writing_mode(WRITING_MODE_HORIZONTAL);
    text.set_font_family("Noto Sans JP");
    text.set_text_align(TEXT_ALIGN_START);
    text.set_color("#000000");
    text.set_background_color("#ffffff");
    std::cout << EncodeJson(catalog.CreateTextContent(args[1], text)) << "\n";
    return 0;
  }

  if (cmd == "add-weather") {
    if (args.size() < 3) return 1;
    WeatherInfo weather;
    weather.set_weather_type(WEATHER_TYPE_CURRENT);
    for (size_t i = 2; i < args.size(); ++i) {
      weather.add_locations(args[i]);
    }
    std::cout << EncodeJson(catalog.CreateWeatherContent(args[1], weather)) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "usage") {
    if (args.size() < 3) return 1;
    const auto& entity = args[1];
    const auto& id     = args[2];
    if (entity == "content") {
      PrintUsage(catalog.CheckContentUsage(id));
      return 0;
    }
    if (entity == "layout") {
      PrintUsage(catalog.CheckLayoutUsage(id));
      return 0;
    }
    if (entity == "playlist") {
      auto usage = catalog.CheckPlaylistUsage(id);
      std::cout << "used=" << (usage.is_used ? "true" : "false") << "\n";
      for (const auto& schedule : usage.schedules) {
        std::cout << "schedule=" << schedule.id << " name=\"" << schedule.name << "\" time=" << schedule.time << "\n";
      }
      return 0;
    }
    return 1;
  }

  if (cmd == "unused") {
    return PrintIndex<ContentIndex>(catalog.ListUnusedContents());
  }

  // ------------------------------------------------------------

  if (cmd == "reconcile") {
    for (const auto& [dir, report] : catalog.ReconcileAll()) {
      std::cout << dir << ": ghosts_pruned=" << report.ghosts_pruned << " orphans_indexed=" << report.orphans_indexed
                << " invalid=" << report.invalid_details.size() << "\n";
    }
    return 0;
  }

  if (cmd == "regenerate-thumbnails") {
    auto report = catalog.RegenerateAllThumbnails();
    std::cout << "total=" << report.total << " success=" << report.success << " failed=" << report.failed.size() << "\n";
    for (const auto& name : report.failed) {
      std::cout << "failed: " << name << "\n";
    }
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? signage::config::ConfigLoader::Defaults() : signage::config::ConfigLoader::LoadFromYaml(config_path);
    signage::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application and run the command
    // ------------------------------------------------------------
    auto app = signage::factory::Build(config);
    int  rc  = Dispatch(*app.catalog, args);
    if (rc == 1) Usage();

    signage::observability::ShutdownLogging();
    return rc;
  } catch (const signage::util::ConflictError& e) {
    std::cerr << e.what() << "\n";
    for (const auto& ref : e.blocking()) {
      std::cerr << "  " << ref.id << " \"" << ref.name << "\"\n";
    }
    signage::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    PrintException(e);
    signage::observability::ShutdownLogging();
    return 2;
  }
}
