#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace upload::storage::common {

// Rejects anything that could escape the directory it is joined onto.
inline void ValidatePathComponent(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw util::InvalidArgument(std::string(what) + " must not be a relative path component");
  }
}

inline std::filesystem::path StagingPath(const std::filesystem::path& root, const std::string& token) {
  ValidatePathComponent(token, "session token");
  return root / (token + ".part");
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& owner_id, const std::string& artifact_id,
                                          const std::string& extension) {
  ValidatePathComponent(owner_id, "owner id");
  ValidatePathComponent(artifact_id, "artifact id");
  return root / owner_id / (artifact_id + extension);
}

} // namespace upload::storage::common
