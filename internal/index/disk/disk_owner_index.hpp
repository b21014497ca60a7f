#pragma once

#include <filesystem>

#include "internal/index/owner_index.hpp"

namespace capsule::index {

/*
  One JSON document per owner:
    <root>/index/<owner>.idx

  Written with temp file + rename, so readers see either the previous or the
  new snapshot.
*/
class DiskOwnerIndex final : public OwnerIndex {
 public:
  DiskOwnerIndex(std::filesystem::path root, bool fsync);

  std::optional<OwnerRecord> Load(const std::string& owner) override;

  void Persist(const std::string& owner, const OwnerRecord& record) override;

  void Remove(const std::string& owner) override;

  std::vector<std::string> ListOwners() override;

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace capsule::index
