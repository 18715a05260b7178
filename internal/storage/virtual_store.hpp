#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/common/json_codec.hpp"
#include "internal/storage/result.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace signage::storage {

struct FileStat {
  util::TimePoint modified_at;
  int64_t         size         = 0;
  bool            is_directory = false;
};

/*
  Sandboxed file-like store.

  Paths are relative to the store root ("contents/index.json"). Every
  write is durable and atomic before it returns: readers observe either
  the previous bytes or the new bytes. No retries at this layer.

  Implementations:
    ArrowFsStore → any arrow::fs::FileSystem (local subtree, in-memory mock)
*/
class VirtualStore {
 public:
  virtual ~VirtualStore() = default;

  // ------------------------------------------------------------------
  // Raw bytes
  // ------------------------------------------------------------------
  /*
    Read the whole file. Throws util::NotFound when the path was never
    written (or was deleted), util::StoreError on I/O failure.
  */
  virtual std::shared_ptr<arrow::Buffer> ReadBytes(const std::string& path) = 0;

  /*
    Replace the file with data, creating parent directories on demand.
  */
  virtual void WriteBytes(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) = 0;

  virtual Result Delete(const std::string& path) = 0;

  // Removes a directory and everything below it.
  virtual Result DeleteTree(const std::string& dir) = 0;

  virtual std::optional<FileStat> Stat(const std::string& path) = 0;

  /*
    Names (not paths) of the direct children of dir, sorted. A missing
    directory lists as empty.
  */
  virtual std::vector<std::string> ListChildren(const std::string& dir) = 0;

  // ------------------------------------------------------------------
  // Structured records
  // ------------------------------------------------------------------
  /*
    Decode the record stored at path.

    Absent path → std::nullopt. Malformed payload → util::CorruptRecord.
    modified_at receives the write time observed for the bytes returned.
  */
  template <typename Message>
  std::optional<Message> ReadRecord(const std::string& path, util::TimePoint* modified_at = nullptr);

  template <typename Message>
  void WriteRecord(const std::string& path, const Message& value) {
    WriteBytes(path, arrow::Buffer::FromString(common::EncodeJson(value)));
  }

  Result DeleteRecord(const std::string& path) {
    return Delete(path);
  }

  bool Exists(const std::string& path) {
    return Stat(path).has_value();
  }
};

using VirtualStorePtr = std::shared_ptr<VirtualStore>;

template <typename Message>
std::optional<Message> VirtualStore::ReadRecord(const std::string& path, util::TimePoint* modified_at) {
  auto stat = Stat(path);
  if (!stat) {
    return std::nullopt;
  }
  if (stat->is_directory) {
    throw util::CorruptRecord(path + ": expected a record, found a directory");
  }

  std::shared_ptr<arrow::Buffer> bytes;
  try {
    bytes = ReadBytes(path);
  } catch (const util::NotFound&) {
    // deleted between Stat and ReadBytes
    return std::nullopt;
  }

  Message     value;
  std::string error;
  if (!common::DecodeJson(bytes->ToString(), &value, &error)) {
    throw util::CorruptRecord(path + ": " + error);
  }

  if (modified_at) {
    *modified_at = stat->modified_at;
  }
  return value;
}

} // namespace signage::storage
