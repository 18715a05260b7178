#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace signage::util {

/*
  Central error types.

  Repositories throw these; the catalog service turns everything except
  ConflictError into OperationFailed with the original nested.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Record failed schema validation. field() is the path of the offending
  field, e.g. "regions[1].width".
*/
class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string field, const std::string& msg) : std::runtime_error(field + ": " + msg), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

struct BlockingReference {
  std::string id;
  std::string name;
};

/*
  Operation refused because other records still reference the target.
*/
class ConflictError : public std::runtime_error {
 public:
  ConflictError(const std::string& msg, std::vector<BlockingReference> blocking)
      : std::runtime_error(msg), blocking_(std::move(blocking)) {
  }

  const std::vector<BlockingReference>& blocking() const {
    return blocking_;
  }

 private:
  std::vector<BlockingReference> blocking_;
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptRecord : public std::runtime_error {
 public:
  explicit CorruptRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OperationFailed : public std::runtime_error {
 public:
  explicit OperationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace signage::util
