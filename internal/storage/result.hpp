#pragma once

#include <string>
#include <utility>

namespace signage::storage {

/*
  Store result codes for outcomes callers are expected to branch on.

  Hard failures still throw util::StoreError; this type carries the
  cases (absent path) that are part of normal control flow.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,

  IOError,
  Corruption
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool IsNotFound() const {
    return code == ErrorCode::NotFound;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace signage::storage
