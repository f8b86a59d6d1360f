#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace reconciler::storage::common {

inline void ValidateFileName(const std::string& file_name) {
  if (file_name.empty()) {
    throw std::invalid_argument("file name must not be empty");
  }
  for (char c : file_name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("file name contains invalid character");
    }
  }
  if (file_name == "." || file_name == "..") {
    throw std::invalid_argument("file name must not be a relative path component");
  }
}

inline void ValidateRelativeDirectory(const std::string& dir) {
  const std::filesystem::path p(dir);
  if (p.is_absolute()) {
    throw std::invalid_argument("workflow path must be relative to the workflows root");
  }
  for (const auto& part : p) {
    if (part == "..") {
      throw std::invalid_argument("workflow path must not leave the workflows root");
    }
  }
}

// root + relative dir, normalized and terminated with '/'.
inline std::string DirectoryUnder(const std::filesystem::path& root, const std::string& dir) {
  ValidateRelativeDirectory(dir);

  auto joined = (dir.empty() ? root : root / dir).lexically_normal().string();
  if (joined.empty() || joined.back() != '/') {
    joined.push_back('/');
  }
  return joined;
}

} // namespace reconciler::storage::common
