#include "internal/analysis/entity_factory.hpp"

#include <algorithm>

#include "internal/identity/node_identifier.hpp"
#include "internal/resolve/type_resolver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::analysis {

using ingest::v1::ParsedEntity;

namespace {

model::StringList ToList(const google::protobuf::RepeatedPtrField<std::string>& values) {
  return model::StringList(values.begin(), values.end());
}

std::string VisibilityOf(const ParsedEntity& record) {
  if (!record.visibility().empty()) return util::ToLower(util::Trim(record.visibility()));
  for (const char* candidate : {"public", "protected", "private"}) {
    if (std::find(record.modifiers().begin(), record.modifiers().end(), candidate) != record.modifiers().end()) {
      return candidate;
    }
  }
  return "package-private";
}

std::string QualifiedName(std::string_view package_name, std::string_view simple_name) {
  auto package = util::Trim(package_name);
  auto simple  = util::Trim(simple_name);
  return package.empty() ? simple : package + "." + simple;
}

} // namespace

model::EntityNode EntityFactory::Create(const ParsedEntity& record) const {
  switch (record.kind()) {
    case ingest::v1::ENTITY_KIND_PACKAGE:
      return CreatePackage(record);
    case ingest::v1::ENTITY_KIND_CLASS:
      return CreateClass(record);
    case ingest::v1::ENTITY_KIND_METHOD:
      return CreateMethod(record);
    case ingest::v1::ENTITY_KIND_FIELD:
      return CreateField(record);
    case ingest::v1::ENTITY_KIND_ANNOTATION: {
      model::StringMap attributes;
      for (const auto& use : record.annotations()) {
        for (const auto& [key, value] : use.attributes()) attributes.emplace(key, CleanAttributeValue(value));
      }
      return CreateAnnotation(QualifiedName(record.package_name(), record.name()), attributes, "");
    }
    case ingest::v1::ENTITY_KIND_MODULE:
      return CreateModule(record);
    case ingest::v1::ENTITY_KIND_REPOSITORY:
      return CreateRepository(record);
    default:
      throw util::InvalidArgument("entity kind cannot be null or empty: " + record.name());
  }
}

std::string EntityFactory::OwnerClassId(const ParsedEntity& record) {
  if (util::Trim(record.declaring_class()).empty()) {
    throw util::InvalidArgument("declaringClass cannot be null or empty");
  }
  return identity::GenerateClassId(record.package_name(), record.declaring_class());
}

std::string EntityFactory::RepositoryIdOf(const ParsedEntity& record) {
  if (!record.has_repository() || record.repository().name().empty() || record.repository().local_path().empty()) return {};
  return identity::GenerateRepositoryId(record.repository().local_path(), record.repository().name());
}

std::string EntityFactory::ModuleIdOf(const ParsedEntity& record) {
  auto repository_id = RepositoryIdOf(record);
  if (repository_id.empty()) return {};

  if (record.kind() == ingest::v1::ENTITY_KIND_MODULE) {
    return identity::GenerateModuleId(repository_id, record.module().path());
  }
  if (util::Trim(record.module_path()).empty()) return {};
  return identity::GenerateModuleId(repository_id, record.module_path());
}

model::PackageNode EntityFactory::CreatePackage(const ParsedEntity& record) const {
  const auto& raw = record.package_name().empty() ? record.name() : record.package_name();

  model::PackageNode node;
  node.id   = identity::GeneratePackageId(raw);
  node.name = identity::NormalizePackageName(raw);
  node.path = node.name;
  std::replace(node.path.begin(), node.path.end(), '.', '/');
  return node;
}

model::ClassNode EntityFactory::CreateClass(const ParsedEntity& record) const {
  model::ClassNode node;
  node.id                   = identity::GenerateClassId(record.package_name(), record.name());
  node.name                 = util::Trim(record.name());
  node.visibility           = VisibilityOf(record);
  node.modifiers            = ToList(record.modifiers());
  node.is_interface         = record.is_interface();
  node.is_enum              = record.is_enum();
  node.is_annotation        = record.is_annotation();
  node.is_external          = false;
  node.file_path            = identity::NormalizeFilePath(record.file_path());
  node.line_start           = record.line_start();
  node.line_end             = record.line_end();
  node.package_name         = util::Trim(record.package_name());
  node.fully_qualified_name = QualifiedName(record.package_name(), record.name());
  node.superclass           = util::Trim(record.superclass());
  node.interfaces           = ToList(record.interfaces());
  node.repository_id        = RepositoryIdOf(record);
  node.module_id            = ModuleIdOf(record);
  return node;
}

model::MethodNode EntityFactory::CreateMethod(const ParsedEntity& record) const {
  model::MethodNode node;
  for (const auto& parameter : record.parameters()) {
    node.parameter_types.push_back(util::Trim(parameter.type()));
    node.parameter_names.push_back(util::Trim(parameter.name()));
    node.parameters.push_back(util::Trim(parameter.type()) + " " + util::Trim(parameter.name()));
  }

  node.id           = identity::GenerateMethodId(OwnerClassId(record), record.name(), node.parameter_types);
  node.name         = util::Trim(record.name());
  node.visibility   = VisibilityOf(record);
  node.modifiers    = ToList(record.modifiers());
  node.return_type  = record.return_type().empty() ? "void" : util::Trim(record.return_type());
  node.file_path    = identity::NormalizeFilePath(record.file_path());
  node.line_start   = record.line_start();
  node.line_end     = record.line_end();
  node.class_name   = util::Trim(record.declaring_class());
  node.package_name = util::Trim(record.package_name());
  return node;
}

model::FieldNode EntityFactory::CreateField(const ParsedEntity& record) const {
  model::FieldNode node;
  node.id           = identity::GenerateFieldId(OwnerClassId(record), record.name(), record.field_type());
  node.name         = util::Trim(record.name());
  node.visibility   = VisibilityOf(record);
  node.modifiers    = ToList(record.modifiers());
  node.type         = record.field_type().empty() ? "Object" : util::Trim(record.field_type());
  node.file_path    = identity::NormalizeFilePath(record.file_path());
  node.line_number  = record.line_start();
  node.class_name   = util::Trim(record.declaring_class());
  node.package_name = util::Trim(record.package_name());
  return node;
}

model::ModuleNode EntityFactory::CreateModule(const ParsedEntity& record) const {
  auto repository_id = RepositoryIdOf(record);
  if (repository_id.empty()) {
    throw util::InvalidArgument("repositoryId cannot be null or empty");
  }

  const auto& info = record.module();

  model::ModuleNode node;
  node.id   = identity::GenerateModuleId(repository_id, info.path());
  node.path = identity::NormalizeFilePath(info.path());
  node.name = util::Trim(record.name());
  if (node.name.empty()) {
    auto slash = node.path.rfind('/');
    node.name  = node.path.empty() ? record.repository().name() : node.path.substr(slash == std::string::npos ? 0 : slash + 1);
  }
  node.type               = info.type();
  node.build_file         = info.build_file();
  node.source_directories = ToList(info.source_directories());
  node.test_directories   = ToList(info.test_directories());
  node.dependencies       = ToList(info.dependencies());
  node.description        = info.description();
  node.version            = info.version();
  node.repository_id      = repository_id;
  return node;
}

model::RepositoryNode EntityFactory::CreateRepository(const ParsedEntity& record) const {
  const auto& info = record.repository();
  const auto& name = info.name().empty() ? record.name() : info.name();

  model::RepositoryNode node;
  node.id               = identity::GenerateRepositoryId(info.local_path(), name);
  node.name             = util::Trim(name);
  node.organization     = info.organization();
  node.url              = info.url();
  node.clone_url        = info.clone_url();
  node.default_branch   = info.default_branch();
  node.last_commit_hash = info.last_commit_hash();
  node.local_path       = identity::NormalizeFilePath(info.local_path());
  node.total_files      = info.total_files();
  return node;
}

model::AnnotationNode EntityFactory::CreateAnnotation(std::string_view fully_qualified_name, const model::StringMap& attributes,
                                                      std::string_view target_type) const {
  auto fqn = util::Trim(fully_qualified_name);
  if (fqn.starts_with('@')) fqn.erase(0, 1);

  model::AnnotationNode node;
  node.id                   = identity::GenerateAnnotationId(resolve::ExtractPackageName(fqn), resolve::ExtractSimpleClassName(fqn));
  node.name                 = resolve::ExtractSimpleClassName(fqn);
  node.fully_qualified_name = fqn;
  node.attributes           = attributes;
  node.target_type          = std::string(target_type);
  node.is_framework         = IsFrameworkAnnotation(fqn);
  node.framework_type       = FrameworkTypeOf(fqn);
  return node;
}

std::string FrameworkTypeOf(std::string_view fqn) {
  if (fqn.starts_with("java.lang.")) return "Java";
  if (fqn.starts_with("org.springframework.")) return "Spring";
  if (fqn.starts_with("org.junit.") || fqn.starts_with("junit.")) return "JUnit";
  if (fqn.starts_with("jakarta.validation.") || fqn.starts_with("javax.validation.")) return "Validation";
  if (fqn.starts_with("jakarta.persistence.") || fqn.starts_with("javax.persistence.")) return "JPA";
  if (fqn.starts_with("com.fasterxml.jackson.")) return "Jackson";
  return {};
}

bool IsFrameworkAnnotation(std::string_view fqn) {
  return fqn.starts_with("java.lang.") || fqn.starts_with("org.springframework.") || fqn.starts_with("org.junit.") || fqn.starts_with("jakarta.") ||
         fqn.starts_with("javax.") || fqn.starts_with("com.fasterxml.jackson.");
}

std::string CleanAttributeValue(std::string_view raw) {
  auto cleaned = util::Trim(raw);
  if (cleaned.size() >= 2 && ((cleaned.front() == '"' && cleaned.back() == '"') || (cleaned.front() == '\'' && cleaned.back() == '\''))) {
    return cleaned.substr(1, cleaned.size() - 2);
  }
  return cleaned;
}

} // namespace codegraph::analysis
