#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace signage::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StoreError naming the
  operation that failed.
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) throw util::StoreError(context + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) throw util::StoreError(context + ": " + status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& context) {
  auto size = Unwrap(file->GetSize(), context);
  return Unwrap(file->Read(size), context);
}

inline std::shared_ptr<arrow::Buffer> BufferFromString(std::string data) {
  return arrow::Buffer::FromString(std::move(data));
}

} // namespace signage::storage::common
