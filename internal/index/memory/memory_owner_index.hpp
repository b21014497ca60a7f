#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/index/owner_index.hpp"

namespace capsule::index {

/*
  Process-local index. Documents are kept serialized so Load always hands
  out an independent copy, as the disk index does.
*/
class MemoryOwnerIndex final : public OwnerIndex {
 public:
  std::optional<OwnerRecord> Load(const std::string& owner) override;

  void Persist(const std::string& owner, const OwnerRecord& record) override;

  void Remove(const std::string& owner) override;

  std::vector<std::string> ListOwners() override;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> documents_;
};

} // namespace capsule::index
