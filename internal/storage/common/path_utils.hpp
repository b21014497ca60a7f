#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace capsule::storage::common {

inline constexpr std::string_view kTempSuffix  = ".tmp";
inline constexpr std::string_view kIndexSuffix = ".idx";

/*
  Owner names and version ids become single path components.
*/
inline void ValidateComponent(std::string_view what, const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (value.front() == '.') {
    throw std::invalid_argument(std::string(what) + " must not start with '.'");
  }
}

inline std::filesystem::path ObjectsRoot(const std::filesystem::path& root) {
  return root / "objects";
}

inline std::filesystem::path IndexRoot(const std::filesystem::path& root) {
  return root / "index";
}

inline std::filesystem::path OwnerObjectDir(const std::filesystem::path& root, const std::string& owner) {
  ValidateComponent("owner", owner);
  return ObjectsRoot(root) / owner;
}

inline std::filesystem::path ObjectPath(const std::filesystem::path& root, const std::string& owner, const std::string& version_id) {
  ValidateComponent("version id", version_id);
  return OwnerObjectDir(root, owner) / version_id;
}

inline std::filesystem::path IndexPath(const std::filesystem::path& root, const std::string& owner) {
  ValidateComponent("owner", owner);
  return IndexRoot(root) / (owner + std::string(kIndexSuffix));
}

inline std::filesystem::path TempPathFor(const std::filesystem::path& final_path) {
  return final_path.string() + std::string(kTempSuffix);
}

inline bool IsTempName(const std::string& name) {
  return name.size() >= kTempSuffix.size() && name.compare(name.size() - kTempSuffix.size(), kTempSuffix.size(), kTempSuffix) == 0;
}

} // namespace capsule::storage::common
