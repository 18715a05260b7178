#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace signage::storage::common {

/*
  Store paths are '/'-separated and relative to the store root.
  Empty segments, "." and ".." are rejected so a path can never leave
  the sandbox.
*/
inline void ValidatePath(std::string_view path) {
  if (path.empty()) {
    throw std::invalid_argument("store path must not be empty");
  }
  if (path.front() == '/') {
    throw std::invalid_argument("store path must be relative: " + std::string(path));
  }

  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    auto segment = path.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("invalid store path: " + std::string(path));
    }
    for (char c : segment) {
      if (c == '\\' || c == '\0') {
        throw std::invalid_argument("store path contains invalid character: " + std::string(path));
      }
    }
    start = end + 1;
  }
}

inline std::string ParentPath(std::string_view path) {
  auto slash = path.rfind('/');
  if (slash == std::string_view::npos) return {};
  return std::string(path.substr(0, slash));
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
  std::string joined(dir);
  if (!joined.empty() && joined.back() != '/') joined.push_back('/');
  joined.append(name);
  return joined;
}

/*
  Uploaded file names become the last segment of a store path.
*/
inline std::string SanitizeFileName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      out.push_back('_');
    } else {
      out.push_back(c);
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "file";
  }
  return out;
}

} // namespace signage::storage::common
