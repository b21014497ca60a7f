#pragma once

#include <google/protobuf/repeated_field.h>

#include <algorithm>
#include <string>

namespace capsule::index {

// Repeated string fields used as sorted sets (tags, tag members).

inline bool ContainsSorted(const google::protobuf::RepeatedPtrField<std::string>& field, const std::string& value) {
  return std::binary_search(field.begin(), field.end(), value);
}

inline bool InsertSorted(google::protobuf::RepeatedPtrField<std::string>* field, const std::string& value) {
  auto pos = std::lower_bound(field->begin(), field->end(), value);
  if (pos != field->end() && *pos == value) {
    return false;
  }
  const auto offset = pos - field->begin();
  *field->Add() = value;
  std::rotate(field->begin() + offset, field->end() - 1, field->end());
  return true;
}

inline bool EraseSorted(google::protobuf::RepeatedPtrField<std::string>* field, const std::string& value) {
  auto pos = std::lower_bound(field->begin(), field->end(), value);
  if (pos == field->end() || *pos != value) {
    return false;
  }
  field->erase(pos);
  return true;
}

inline bool IsSortedUnique(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return std::adjacent_find(field.begin(), field.end(), [](const std::string& a, const std::string& b) { return !(a < b); }) == field.end();
}

} // namespace capsule::index
