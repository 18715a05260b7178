#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace signage::storage::common {

/*
  Records are stored as the protobuf JSON mapping, indented.
*/
inline std::string EncodeJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StoreError("encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

/*
  Unknown keys are ignored so files written with extra fields still load.
  Returns false with the parser message on malformed input.
*/
inline bool DecodeJson(std::string_view json, google::protobuf::Message* message, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), message, options);
  if (!status.ok()) {
    if (error) *error = std::string(status.message());
    return false;
  }
  return true;
}

} // namespace signage::storage::common
