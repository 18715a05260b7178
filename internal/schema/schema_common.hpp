#pragma once

#include <google/protobuf/repeated_field.h>
#include <google/protobuf/timestamp.pb.h>

#include <string>
#include <string_view>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace signage::schema {

[[noreturn]] inline void Fail(const std::string& field, const std::string& message) {
  throw util::ValidationError(field, message);
}

inline void Require(bool condition, const std::string& field, const std::string& message) {
  if (!condition) Fail(field, message);
}

inline void RequireNonEmpty(const std::string& value, const std::string& field) {
  Require(!value.empty(), field, "must not be empty");
}

inline std::string Indexed(std::string_view field, int index) {
  return std::string(field) + "[" + std::to_string(index) + "]";
}

inline std::string Nested(std::string_view parent, std::string_view field) {
  return std::string(parent) + "." + std::string(field);
}

inline bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

inline bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

inline bool IsHexDigit(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// #RRGGBB
inline bool IsHexColor(std::string_view value) {
  if (value.size() != 7 || value[0] != '#') return false;
  for (size_t i = 1; i < value.size(); ++i) {
    if (!IsHexDigit(value[i])) return false;
  }
  return true;
}

// HH:MM, 00:00 through 23:59
inline bool IsTimeOfDay(std::string_view value) {
  if (value.size() != 5 || value[2] != ':') return false;
  if (!IsDigit(value[0]) || !IsDigit(value[1]) || !IsDigit(value[3]) || !IsDigit(value[4])) return false;
  const int hours   = (value[0] - '0') * 10 + (value[1] - '0');
  const int minutes = (value[3] - '0') * 10 + (value[4] - '0');
  return hours <= 23 && minutes <= 59;
}

/*
  Absolute http(s) URL with a non-empty host.
*/
inline bool IsHttpUrl(std::string_view value) {
  std::string_view rest;
  if (StartsWith(value, "https://")) {
    rest = value.substr(8);
  } else if (StartsWith(value, "http://")) {
    rest = value.substr(7);
  } else {
    return false;
  }
  auto host = rest.substr(0, rest.find_first_of("/?#"));
  if (host.empty()) return false;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return false;
  }
  return true;
}

/*
  Record timestamps: createdAt is mandatory, a missing updatedAt takes
  createdAt.
*/
inline void NormalizeTimestamps(google::protobuf::Timestamp* created_at, google::protobuf::Timestamp* updated_at) {
  Require(util::IsSet(*created_at), "createdAt", "must be set");
  if (!util::IsSet(*updated_at)) {
    *updated_at = *created_at;
  }
}

/*
  Drops duplicates (first occurrence wins) and rejects empty strings.
*/
inline void NormalizeStringSet(google::protobuf::RepeatedPtrField<std::string>* values, const std::string& field) {
  std::unordered_set<std::string>               seen;
  google::protobuf::RepeatedPtrField<std::string> unique;
  for (int i = 0; i < values->size(); ++i) {
    const auto& value = values->Get(i);
    Require(!value.empty(), Indexed(field, i), "must not be empty");
    if (seen.insert(value).second) {
      *unique.Add() = value;
    }
  }
  values->Swap(&unique);
}

} // namespace signage::schema
