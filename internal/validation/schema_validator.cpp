#include "schema_validator.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace capsule::validation {

namespace {

void RequireNonEmpty(const std::string& owner, const arrow::Buffer& content) {
  if (content.size() == 0) {
    throw util::ValidationFailure("capsule content for owner '" + owner + "' is empty");
  }
}

void CopyStringField(const google::protobuf::Struct& object, std::string_view key, std::string* out) {
  const auto it = object.fields().find(std::string(key));
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return;
  }
  if (!it->second.string_value().empty()) {
    *out = it->second.string_value();
  }
}

} // namespace

CapsuleDescriptor PassthroughSchemaValidator::Validate(const std::string& owner, const arrow::Buffer& content) const {
  RequireNonEmpty(owner, content);
  return {};
}

std::vector<std::string> StructuralSchemaValidator::DefaultRequiredSections() {
  return {"metadata", "traits", "personality", "memory", "environment"};
}

StructuralSchemaValidator::StructuralSchemaValidator(std::vector<std::string> required_sections, bool enforce_owner_match)
    : required_sections_(std::move(required_sections)), enforce_owner_match_(enforce_owner_match) {
}

CapsuleDescriptor StructuralSchemaValidator::Validate(const std::string& owner, const arrow::Buffer& content) const {
  RequireNonEmpty(owner, content);

  google::protobuf::Struct document;
  const auto               status = google::protobuf::util::JsonStringToMessage(content.ToString(), &document);
  if (!status.ok()) {
    throw util::ValidationFailure("capsule content is not a JSON object: " + std::string(status.message()));
  }

  for (const auto& section : required_sections_) {
    if (document.fields().find(section) == document.fields().end()) {
      throw util::ValidationFailure("capsule is missing required section '" + section + "'");
    }
  }

  CapsuleDescriptor descriptor;

  const auto metadata_it = document.fields().find("metadata");
  if (metadata_it == document.fields().end()) {
    return descriptor;
  }
  if (metadata_it->second.kind_case() != google::protobuf::Value::kStructValue) {
    throw util::ValidationFailure("capsule section 'metadata' must be an object");
  }

  const auto& metadata = metadata_it->second.struct_value();
  CopyStringField(metadata, "capsule_version", &descriptor.schema_version);
  CopyStringField(metadata, "generator", &descriptor.producer_id);
  CopyStringField(metadata, "vault_source", &descriptor.source_tag);

  if (enforce_owner_match_) {
    std::string instance_name;
    CopyStringField(metadata, "instance_name", &instance_name);
    if (!instance_name.empty() && instance_name != owner) {
      throw util::ValidationFailure("capsule metadata.instance_name '" + instance_name + "' does not match owner '" + owner + "'");
    }
  }

  return descriptor;
}

} // namespace capsule::validation
