#pragma once

#include <string>
#include <string_view>

#include "codegraph/ingest/v1/records.pb.h"
#include "internal/model/node.hpp"

namespace codegraph::analysis {

/*
  Builds in-memory nodes from parser records.

  Assigns every id through the identity functions and copies the
  syntactic attributes. No I/O and no timestamps: created_at/updated_at
  are stamped by the upsert engine when a node is written.

  Throws util::InvalidArgument when a record lacks a required key part
  (class name, member name, owning class).
*/
class EntityFactory {
 public:
  model::EntityNode Create(const ingest::v1::ParsedEntity& record) const;

  // Annotation node for one sighting; `fully_qualified_name` may be a
  // simple name when the annotation could not be resolved.
  model::AnnotationNode CreateAnnotation(std::string_view fully_qualified_name, const model::StringMap& attributes,
                                         std::string_view target_type) const;

  // Owning class id of a member record.
  static std::string OwnerClassId(const ingest::v1::ParsedEntity& record);

  // Repository id of a record's scope, "" when the record carries none.
  static std::string RepositoryIdOf(const ingest::v1::ParsedEntity& record);

  // Module id of a record's scope, "" when the record carries none.
  static std::string ModuleIdOf(const ingest::v1::ParsedEntity& record);

 private:
  model::PackageNode    CreatePackage(const ingest::v1::ParsedEntity& record) const;
  model::ClassNode      CreateClass(const ingest::v1::ParsedEntity& record) const;
  model::MethodNode     CreateMethod(const ingest::v1::ParsedEntity& record) const;
  model::FieldNode      CreateField(const ingest::v1::ParsedEntity& record) const;
  model::ModuleNode     CreateModule(const ingest::v1::ParsedEntity& record) const;
  model::RepositoryNode CreateRepository(const ingest::v1::ParsedEntity& record) const;
};

// "Java", "Spring", "JUnit", "Validation", "JPA", "Jackson" or "".
std::string FrameworkTypeOf(std::string_view fully_qualified_name);

bool IsFrameworkAnnotation(std::string_view fully_qualified_name);

// Strips one pair of surrounding double or single quotes.
std::string CleanAttributeValue(std::string_view raw);

} // namespace codegraph::analysis
