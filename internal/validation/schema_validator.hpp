#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

namespace capsule::validation {

/*
  Descriptive metadata lifted from capsule content and carried through to the
  index unchanged.
*/
struct CapsuleDescriptor {
  std::string schema_version = "1.0.0";
  std::string producer_id    = "CapsuleForge";
  std::string source_tag     = "VVAULT";
};

/*
  Structural check run before a blob is committed.

  Implementations throw util::ValidationFailure; nothing is written when
  validation fails.
*/
class SchemaValidator {
 public:
  virtual ~SchemaValidator() = default;

  virtual CapsuleDescriptor Validate(const std::string& owner, const arrow::Buffer& content) const = 0;
};

using SchemaValidatorPtr = std::shared_ptr<const SchemaValidator>;

// Accepts any non-empty content.
class PassthroughSchemaValidator final : public SchemaValidator {
 public:
  CapsuleDescriptor Validate(const std::string& owner, const arrow::Buffer& content) const override;
};

/*
  Content must be a JSON object carrying every required top-level section.

  The optional `metadata` object supplies capsule_version / generator /
  vault_source, and its instance_name must match the owner when
  enforce_owner_match is set.
*/
class StructuralSchemaValidator final : public SchemaValidator {
 public:
  static std::vector<std::string> DefaultRequiredSections();

  explicit StructuralSchemaValidator(std::vector<std::string> required_sections = DefaultRequiredSections(), bool enforce_owner_match = true);

  CapsuleDescriptor Validate(const std::string& owner, const arrow::Buffer& content) const override;

  const std::vector<std::string>& required_sections() const {
    return required_sections_;
  }

 private:
  std::vector<std::string> required_sections_;
  bool                     enforce_owner_match_;
};

} // namespace capsule::validation
