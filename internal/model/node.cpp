#include "internal/model/node.hpp"

#include <set>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace codegraph::model {

namespace {

class PropertyWriter {
 public:
  PropertyWriter& Str(const char* key, const std::string& value) {
    if (!value.empty()) props_[key] = value;
    return *this;
  }

  PropertyWriter& Int(const char* key, std::int64_t value) {
    props_[key] = value;
    return *this;
  }

  PropertyWriter& Bool(const char* key, bool value) {
    props_[key] = value;
    return *this;
  }

  PropertyWriter& List(const char* key, const StringList& value) {
    if (!value.empty()) props_[key] = value;
    return *this;
  }

  PropertyWriter& Map(const char* key, const StringMap& value) {
    if (!value.empty()) props_[key] = value;
    return *this;
  }

  PropertyMap Take() {
    return std::move(props_);
  }

 private:
  PropertyMap props_;
};

class PropertyReader {
 public:
  explicit PropertyReader(const PropertyMap& props) : props_(props) {
  }

  std::string Str(const char* key) const {
    return Get<std::string>(key);
  }

  std::int64_t Int(const char* key) const {
    return Get<std::int64_t>(key);
  }

  bool Bool(const char* key) const {
    return Get<bool>(key);
  }

  StringList List(const char* key) const {
    return Get<StringList>(key);
  }

  StringMap Map(const char* key) const {
    return Get<StringMap>(key);
  }

 private:
  template <typename T>
  T Get(const char* key) const {
    auto it = props_.find(key);
    if (it == props_.end()) return T{};
    if (const auto* value = std::get_if<T>(&it->second)) return *value;
    return T{};
  }

  const PropertyMap& props_;
};

PropertyMap Write(const PackageNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("path", n.path)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const ClassNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("visibility", n.visibility)
      .List("modifiers", n.modifiers)
      .Bool("is_interface", n.is_interface)
      .Bool("is_enum", n.is_enum)
      .Bool("is_annotation", n.is_annotation)
      .Bool("is_external", n.is_external)
      .Str("file_path", n.file_path)
      .Int("line_start", n.line_start)
      .Int("line_end", n.line_end)
      .Str("package_name", n.package_name)
      .Str("fully_qualified_name", n.fully_qualified_name)
      .Str("superclass", n.superclass)
      .List("interfaces", n.interfaces)
      .Str("repository_id", n.repository_id)
      .Str("module_id", n.module_id)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const MethodNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("visibility", n.visibility)
      .List("modifiers", n.modifiers)
      .Str("return_type", n.return_type)
      .List("parameters", n.parameters)
      .List("parameter_types", n.parameter_types)
      .List("parameter_names", n.parameter_names)
      .Str("file_path", n.file_path)
      .Int("line_start", n.line_start)
      .Int("line_end", n.line_end)
      .Str("class_name", n.class_name)
      .Str("package_name", n.package_name)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const FieldNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("visibility", n.visibility)
      .List("modifiers", n.modifiers)
      .Str("type", n.type)
      .Str("file_path", n.file_path)
      .Int("line_number", n.line_number)
      .Str("class_name", n.class_name)
      .Str("package_name", n.package_name)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const AnnotationNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("fully_qualified_name", n.fully_qualified_name)
      .Map("attributes", n.attributes)
      .Str("target_type", n.target_type)
      .Bool("is_framework", n.is_framework)
      .Str("framework_type", n.framework_type)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const ModuleNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("path", n.path)
      .Str("type", n.type)
      .Str("build_file", n.build_file)
      .List("source_directories", n.source_directories)
      .List("test_directories", n.test_directories)
      .List("dependencies", n.dependencies)
      .Str("description", n.description)
      .Str("version", n.version)
      .Str("repository_id", n.repository_id)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

PropertyMap Write(const RepositoryNode& n) {
  return PropertyWriter()
      .Str("id", n.id)
      .Str("name", n.name)
      .Str("organization", n.organization)
      .Str("url", n.url)
      .Str("clone_url", n.clone_url)
      .Str("default_branch", n.default_branch)
      .Str("last_commit_hash", n.last_commit_hash)
      .Str("local_path", n.local_path)
      .Int("total_files", n.total_files)
      .Str("created_at", n.created_at)
      .Str("updated_at", n.updated_at)
      .Take();
}

} // namespace

const std::string& IdOf(const EntityNode& node) {
  return std::visit([](const auto& n) -> const std::string& { return n.id; }, node);
}

PropertyMap ToProperties(const EntityNode& node) {
  return std::visit([](const auto& n) { return Write(n); }, node);
}

EntityNode FromProperties(NodeKind kind, const PropertyMap& properties) {
  PropertyReader r(properties);

  switch (kind) {
    case NodeKind::kPackage: {
      PackageNode n;
      n.id         = r.Str("id");
      n.name       = r.Str("name");
      n.path       = r.Str("path");
      n.created_at = r.Str("created_at");
      n.updated_at = r.Str("updated_at");
      return n;
    }
    case NodeKind::kClass: {
      ClassNode n;
      n.id                   = r.Str("id");
      n.name                 = r.Str("name");
      n.visibility           = r.Str("visibility");
      n.modifiers            = r.List("modifiers");
      n.is_interface         = r.Bool("is_interface");
      n.is_enum              = r.Bool("is_enum");
      n.is_annotation        = r.Bool("is_annotation");
      n.is_external          = r.Bool("is_external");
      n.file_path            = r.Str("file_path");
      n.line_start           = r.Int("line_start");
      n.line_end             = r.Int("line_end");
      n.package_name         = r.Str("package_name");
      n.fully_qualified_name = r.Str("fully_qualified_name");
      n.superclass           = r.Str("superclass");
      n.interfaces           = r.List("interfaces");
      n.repository_id        = r.Str("repository_id");
      n.module_id            = r.Str("module_id");
      n.created_at           = r.Str("created_at");
      n.updated_at           = r.Str("updated_at");
      return n;
    }
    case NodeKind::kMethod: {
      MethodNode n;
      n.id              = r.Str("id");
      n.name            = r.Str("name");
      n.visibility      = r.Str("visibility");
      n.modifiers       = r.List("modifiers");
      n.return_type     = r.Str("return_type");
      n.parameters      = r.List("parameters");
      n.parameter_types = r.List("parameter_types");
      n.parameter_names = r.List("parameter_names");
      n.file_path       = r.Str("file_path");
      n.line_start      = r.Int("line_start");
      n.line_end        = r.Int("line_end");
      n.class_name      = r.Str("class_name");
      n.package_name    = r.Str("package_name");
      n.created_at      = r.Str("created_at");
      n.updated_at      = r.Str("updated_at");
      return n;
    }
    case NodeKind::kField: {
      FieldNode n;
      n.id           = r.Str("id");
      n.name         = r.Str("name");
      n.visibility   = r.Str("visibility");
      n.modifiers    = r.List("modifiers");
      n.type         = r.Str("type");
      n.file_path    = r.Str("file_path");
      n.line_number  = r.Int("line_number");
      n.class_name   = r.Str("class_name");
      n.package_name = r.Str("package_name");
      n.created_at   = r.Str("created_at");
      n.updated_at   = r.Str("updated_at");
      return n;
    }
    case NodeKind::kAnnotation: {
      AnnotationNode n;
      n.id                   = r.Str("id");
      n.name                 = r.Str("name");
      n.fully_qualified_name = r.Str("fully_qualified_name");
      n.attributes           = r.Map("attributes");
      n.target_type          = r.Str("target_type");
      n.is_framework         = r.Bool("is_framework");
      n.framework_type       = r.Str("framework_type");
      n.created_at           = r.Str("created_at");
      n.updated_at           = r.Str("updated_at");
      return n;
    }
    case NodeKind::kModule: {
      ModuleNode n;
      n.id                 = r.Str("id");
      n.name               = r.Str("name");
      n.path               = r.Str("path");
      n.type               = r.Str("type");
      n.build_file         = r.Str("build_file");
      n.source_directories = r.List("source_directories");
      n.test_directories   = r.List("test_directories");
      n.dependencies       = r.List("dependencies");
      n.description        = r.Str("description");
      n.version            = r.Str("version");
      n.repository_id      = r.Str("repository_id");
      n.created_at         = r.Str("created_at");
      n.updated_at         = r.Str("updated_at");
      return n;
    }
    case NodeKind::kRepository: {
      RepositoryNode n;
      n.id               = r.Str("id");
      n.name             = r.Str("name");
      n.organization     = r.Str("organization");
      n.url              = r.Str("url");
      n.clone_url        = r.Str("clone_url");
      n.default_branch   = r.Str("default_branch");
      n.last_commit_hash = r.Str("last_commit_hash");
      n.local_path       = r.Str("local_path");
      n.total_files      = r.Int("total_files");
      n.created_at       = r.Str("created_at");
      n.updated_at       = r.Str("updated_at");
      return n;
    }
  }
  throw util::InvalidArgument("unknown node kind: " + std::to_string(static_cast<int>(kind)));
}

bool IsInsignificantProperty(const std::string& key) {
  return key == "created_at" || key == "updated_at";
}

bool IsUnorderedProperty(const std::string& key) {
  static const std::set<std::string> kUnordered = {"modifiers", "interfaces", "source_directories", "test_directories", "dependencies"};
  return kUnordered.contains(key);
}

} // namespace codegraph::model
