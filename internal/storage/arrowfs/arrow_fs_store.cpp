#include "arrow_fs_store.hpp"

#include <arrow/io/interfaces.h>

#include <algorithm>
#include <chrono>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace signage::storage {

using namespace signage::storage::common;

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ArrowFsStore::ArrowFsStore(std::shared_ptr<arrow::fs::FileSystem> fs) : fs_(std::move(fs)) {
}

std::shared_ptr<arrow::Buffer> ArrowFsStore::ReadBytes(const std::string& path) {
  ValidatePath(path);

  auto info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("no such file: " + path);
  }
  if (info.type() != arrow::fs::FileType::File) {
    throw util::StoreError("not a file: " + path);
  }

  auto input = Unwrap(fs_->OpenInputFile(info), "open " + path);
  auto bytes = ReadAll(input, "read " + path);
  Unwrap(input->Close(), "close " + path);
  return bytes;
}

/*
  Atomic replace:

      <path>.tmp  ← bytes, closed
      <path>.tmp  → <path>
*/
void ArrowFsStore::WriteBytes(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) {
  ValidatePath(path);

  auto parent = ParentPath(path);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true), "mkdir " + parent);
  }

  const auto tmp_path = path + kTempSuffix;
  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path), "open " + tmp_path);
    Unwrap(out->Write(data), "write " + tmp_path);
    Unwrap(out->Close(), "close " + tmp_path);
  }

  auto moved = fs_->Move(tmp_path, path);
  if (!moved.ok()) {
    (void)fs_->DeleteFile(tmp_path);
    Unwrap(moved, "rename " + tmp_path);
  }
}

Result ArrowFsStore::Delete(const std::string& path) {
  ValidatePath(path);

  auto info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() == arrow::fs::FileType::NotFound) {
    return Result::Err(ErrorCode::NotFound, path);
  }
  if (info.type() == arrow::fs::FileType::Directory) {
    return Result::Err(ErrorCode::IOError, "is a directory: " + path);
  }

  Unwrap(fs_->DeleteFile(path), "delete " + path);
  return Result::Ok();
}

Result ArrowFsStore::DeleteTree(const std::string& dir) {
  ValidatePath(dir);

  auto info = Unwrap(fs_->GetFileInfo(dir), "stat " + dir);
  if (info.type() == arrow::fs::FileType::NotFound) {
    return Result::Err(ErrorCode::NotFound, dir);
  }
  if (info.type() != arrow::fs::FileType::Directory) {
    return Result::Err(ErrorCode::IOError, "not a directory: " + dir);
  }

  Unwrap(fs_->DeleteDir(dir), "delete " + dir);
  return Result::Ok();
}

std::optional<FileStat> ArrowFsStore::Stat(const std::string& path) {
  ValidatePath(path);

  auto info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() == arrow::fs::FileType::NotFound) {
    return std::nullopt;
  }

  FileStat stat;
  stat.modified_at  = std::chrono::time_point_cast<util::Clock::duration>(info.mtime());
  stat.size         = info.size();
  stat.is_directory = info.type() == arrow::fs::FileType::Directory;
  return stat;
}

std::vector<std::string> ArrowFsStore::ListChildren(const std::string& dir) {
  ValidatePath(dir);

  arrow::fs::FileSelector selector;
  selector.base_dir        = dir;
  selector.allow_not_found = true;
  selector.recursive       = false;

  auto infos = Unwrap(fs_->GetFileInfo(selector), "list " + dir);

  std::vector<std::string> names;
  names.reserve(infos.size());
  for (const auto& info : infos) {
    auto name = info.base_name();
    // in-flight writes are not children yet
    if (EndsWith(name, kTempSuffix)) continue;
    names.push_back(std::move(name));
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace signage::storage
