#include "internal/analysis/relationship_analyzer.hpp"

#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "internal/identity/node_identifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::analysis {

using ingest::v1::AnnotationUse;
using ingest::v1::ParsedEntity;
using model::EdgeType;
using model::UsesKind;

namespace {

constexpr int kMaxGenericDepth = 8;

// Generic type variables (T, E, K) are never edge targets.
bool IsTypeVariable(std::string_view name) {
  return name.size() == 1 && std::isupper(static_cast<unsigned char>(name.front()));
}

bool IsReferenceType(std::string_view base) {
  return !base.empty() && base != "?" && !resolve::IsPrimitiveType(base) && !IsTypeVariable(base);
}

bool LooksLikeTypeName(std::string_view scope) {
  auto simple = resolve::ExtractSimpleClassName(scope);
  return !simple.empty() && std::isupper(static_cast<unsigned char>(simple.front()));
}

std::string QualifiedName(std::string_view package_name, std::string_view simple_name) {
  auto package = util::Trim(package_name);
  auto simple  = util::Trim(simple_name);
  return package.empty() ? simple : package + "." + simple;
}

// Per-unit accumulator; one instance per Analyze call.
class UnitAnalysis {
 public:
  UnitAnalysis(const IdRegistry& registry, const resolve::TypeResolver& resolver, const EntityFactory& factory,
               model::AttributePolicy policy, const CompilationUnit& unit)
      : registry_(registry), resolver_(resolver), factory_(factory), policy_(policy) {
    std::vector<std::string> declarations;
    for (const auto& entity : unit.entities) {
      declarations.insert(declarations.end(), entity.record.imports().begin(), entity.record.imports().end());
    }
    imports_ = resolve::ImportTable::Parse(declarations);
  }

  void Visit(const MintedEntity& entity) {
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, model::PackageNode>) {
            VisitPackage(entity.record, node);
          } else if constexpr (std::is_same_v<T, model::ClassNode>) {
            VisitClass(entity.record, node);
          } else if constexpr (std::is_same_v<T, model::MethodNode>) {
            VisitMethod(entity.record, node);
          } else if constexpr (std::is_same_v<T, model::FieldNode>) {
            VisitField(entity.record, node);
          } else if constexpr (std::is_same_v<T, model::ModuleNode>) {
            VisitModule(node);
          }
        },
        entity.node);
  }

  AnalysisResult Finish() {
    AnalysisResult result;
    result.edges = std::move(edges_);
    result.annotation_nodes.reserve(annotation_order_.size());
    for (const auto& id : annotation_order_) {
      result.annotation_nodes.emplace_back(std::move(annotations_.at(id)));
    }
    return result;
  }

 private:
  // -------------------------------------------------------------------
  // Per-kind visitors
  // -------------------------------------------------------------------

  void VisitPackage(const ParsedEntity& record, const model::PackageNode& node) {
    AddContains(EntityFactory::ModuleIdOf(record), node.id);
  }

  void VisitModule(const model::ModuleNode& node) {
    AddContains(node.repository_id, node.id);
  }

  void VisitClass(const ParsedEntity& record, const model::ClassNode& node) {
    const auto package = util::Trim(record.package_name());

    AddContains(identity::GeneratePackageId(record.package_name()), node.id);
    AddContains(node.module_id, node.id);

    if (!node.superclass.empty()) {
      AddTypeEdge(node.id, EdgeType::kExtends, node.superclass, package);
    }
    for (const auto& interface_name : node.interfaces) {
      AddTypeEdge(node.id, EdgeType::kImplements, interface_name, package);
    }

    for (const auto& fqn : imports_.ImportedTypes()) {
      resolve::ResolvedType imported{fqn, resolve::ExtractSimpleClassName(fqn), resolve::Resolution::kImport};
      AddUses(node.id, imported, UsesKind::kImport, fqn);
    }

    for (const auto& use : record.annotations()) {
      AddAnnotation(node.id, use, "class", "class-level annotation", package);
    }
  }

  void VisitField(const ParsedEntity& record, const model::FieldNode& node) {
    const auto owner   = EntityFactory::OwnerClassId(record);
    const auto package = util::Trim(record.package_name());

    AddContains(owner, node.id);

    if (registry_.Contains(owner)) {
      AddDeclaredType(owner, node.type, package, UsesKind::kFieldType, "field: " + node.name + " type: " + node.type, "field", node.name);
    }

    for (const auto& use : record.annotations()) {
      AddAnnotation(node.id, use, "field", "field: " + node.name, package);
    }
  }

  void VisitMethod(const ParsedEntity& record, const model::MethodNode& node) {
    const auto owner   = EntityFactory::OwnerClassId(record);
    const auto package = util::Trim(record.package_name());
    const auto context = "method: " + node.name;

    AddContains(owner, node.id);

    if (registry_.Contains(owner)) {
      AddDeclaredType(owner, node.return_type, package, UsesKind::kMethodReturn, context, "method_return", node.name);
      for (const auto& parameter : record.parameters()) {
        const auto name = util::Trim(parameter.name());
        AddDeclaredType(owner, parameter.type(), package, UsesKind::kMethodParam, context + " param: " + name, "method_param",
                        node.name + "." + name);
      }
    }

    for (const auto& use : record.annotations()) {
      AddAnnotation(node.id, use, "method", context, package);
    }
    for (const auto& parameter : record.parameters()) {
      for (const auto& use : parameter.annotations()) {
        AddAnnotation(node.id, use, "parameter", "parameter: " + util::Trim(parameter.name()) + " (" + context + ")", package);
      }
    }

    AddBodyReferences(record, node, owner, package, context);
  }

  // -------------------------------------------------------------------
  // Method bodies
  // -------------------------------------------------------------------

  void AddBodyReferences(const ParsedEntity& record, const model::MethodNode& node, const std::string& owner, const std::string& package,
                         const std::string& context) {
    const bool owner_minted = registry_.Contains(owner);

    for (const auto& created : record.instantiations()) {
      const auto base = resolve::StripTypeDecorations(created);
      if (!owner_minted || !IsReferenceType(resolve::ExtractSimpleClassName(base))) continue;
      AddUses(owner, resolver_.Resolve(base, imports_, package), UsesKind::kInstantiation, context);
    }

    for (const auto& call : record.calls()) {
      const auto scope = util::Trim(call.scope());
      std::optional<std::string> target_class;

      if (scope.empty() || scope == "this") {
        auto static_owner = scope.empty() ? imports_.LookupStaticMember(call.name()) : std::nullopt;
        if (static_owner) {
          resolve::ResolvedType type{*static_owner, resolve::ExtractSimpleClassName(*static_owner), resolve::Resolution::kImport};
          if (owner_minted) AddUses(owner, type, UsesKind::kMethodCall, context);
          target_class = registry_.ClassIdFor(*static_owner);
        } else {
          target_class = owner;
        }
      } else if (auto field = registry_.FindField(owner, scope)) {
        target_class = registry_.ClassIdFor(resolver_.Resolve(field->declared_type, imports_, package).fully_qualified_name);
      } else if (LooksLikeTypeName(scope)) {
        auto type = resolver_.Resolve(scope, imports_, package);
        if (owner_minted && type.resolution == resolve::Resolution::kImport) {
          AddUses(owner, type, UsesKind::kMethodCall, context);
        }
        target_class = registry_.ClassIdFor(type.fully_qualified_name);
      }

      if (!target_class) continue;

      auto candidates = registry_.FindMethods(*target_class, call.name(), static_cast<std::size_t>(call.argument_count()));
      if (candidates.size() != 1) continue;

      model::RelationshipEdge edge;
      edge.from_id                      = node.id;
      edge.to_id                        = candidates.front().id;
      edge.type                         = EdgeType::kCalls;
      edge.context                      = context;
      edge.properties["call_name"]      = call.name();
      edge.properties["argument_count"] = static_cast<std::int64_t>(call.argument_count());
      edge.properties["is_external"]    = false;
      edge.properties["resolved"]       = true;
      Push(std::move(edge));
    }

    for (const auto& accessed : record.field_accesses()) {
      auto field = registry_.FindField(owner, util::Trim(accessed));
      if (!field) continue;

      model::RelationshipEdge edge;
      edge.from_id                            = node.id;
      edge.to_id                              = field->id;
      edge.type                               = EdgeType::kUses;
      edge.kind                               = std::string(model::ToString(UsesKind::kFieldAccess));
      edge.context                            = context;
      edge.properties["is_external"]          = false;
      edge.properties["resolved"]             = true;
      edge.properties["fully_qualified_name"] = QualifiedName(record.package_name(), record.declaring_class()) + "." + util::Trim(accessed);
      Push(std::move(edge));
    }
  }

  // -------------------------------------------------------------------
  // Edge builders
  // -------------------------------------------------------------------

  void AddContains(const std::string& from, const std::string& to) {
    if (from.empty() || !registry_.Contains(from) || !registry_.Contains(to)) return;

    model::RelationshipEdge edge;
    edge.from_id = from;
    edge.to_id   = to;
    edge.type    = EdgeType::kContains;
    Push(std::move(edge));
  }

  void AddTypeEdge(const std::string& from, EdgeType type, const std::string& reference, const std::string& package) {
    const auto base = resolve::StripTypeDecorations(reference);
    if (!IsReferenceType(resolve::ExtractSimpleClassName(base))) return;

    auto resolved = resolver_.Resolve(base, imports_, package);
    auto to       = TargetId(resolved);
    if (to.empty()) return;

    model::RelationshipEdge edge;
    edge.from_id    = from;
    edge.to_id      = std::move(to);
    edge.type       = type;
    edge.properties = TargetProperties(resolved, edge.to_id);
    Push(std::move(edge));
  }

  // Direct USES edge for a declared type plus its generic arguments.
  void AddDeclaredType(const std::string& from, const std::string& declaration, const std::string& package, UsesKind kind,
                       const std::string& context, const std::string& usage, const std::string& element) {
    const auto base = resolve::StripTypeDecorations(declaration);
    if (IsReferenceType(resolve::ExtractSimpleClassName(base))) {
      AddUses(from, resolver_.Resolve(base, imports_, package), kind, context);
    }
    AddGenericArguments(from, util::Trim(declaration), package, usage, element, 0);
  }

  void AddGenericArguments(const std::string& from, const std::string& declaration, const std::string& package, const std::string& usage,
                           const std::string& element, int depth) {
    if (depth >= kMaxGenericDepth) return;

    for (const auto& argument : resolve::SplitTypeArguments(declaration)) {
      if (argument == "?") continue;

      const auto bound = resolve::WildcardBound(argument);
      const auto base  = resolve::StripTypeDecorations(bound);
      if (!IsReferenceType(resolve::ExtractSimpleClassName(base))) continue;

      model::PropertyMap extra;
      extra["type_argument"] = argument.starts_with('?') ? argument : base;
      AddUses(from, resolver_.Resolve(base, imports_, package), UsesKind::kGenericParam, usage + " " + element + " " + declaration,
              std::move(extra));

      if (bound.find('<') != std::string::npos) {
        AddGenericArguments(from, bound, package, "nested_generic", element, depth + 1);
      }
    }
  }

  void AddUses(const std::string& from, const resolve::ResolvedType& type, UsesKind kind, const std::string& context,
               model::PropertyMap extra = {}) {
    auto to = TargetId(type);
    if (to.empty()) return;

    if (!type.resolved()) {
      CODEGRAPH_LOG_DEBUG("Unresolved type reference",
                          {observability::StringField("from", from), observability::StringField("type", type.simple_name),
                           observability::StringField("kind", model::ToString(kind))});
    }

    model::RelationshipEdge edge;
    edge.from_id    = from;
    edge.to_id      = std::move(to);
    edge.type       = EdgeType::kUses;
    edge.kind       = std::string(model::ToString(kind));
    edge.context    = context;
    edge.properties = TargetProperties(type, edge.to_id);
    for (auto& [key, value] : extra) {
      edge.properties[key] = std::move(value);
    }
    Push(std::move(edge));
  }

  void AddAnnotation(const std::string& from, const AnnotationUse& use, const std::string& target_type, const std::string& context,
                     const std::string& package) {
    if (!registry_.Contains(from)) return;

    auto fqn = AnnotationName(use, package);
    if (fqn.empty()) return;
    if (resolve::ExtractSimpleClassName(fqn).empty()) {
      CODEGRAPH_LOG_WARN("Annotation skipped", {observability::StringField("from", from), observability::StringField("annotation", fqn),
                                                observability::StringField("error", "annotation has no simple name")});
      return;
    }

    model::StringMap attributes;
    for (const auto& [key, value] : use.attributes()) {
      attributes.emplace(key, CleanAttributeValue(value));
    }

    auto node = factory_.CreateAnnotation(fqn, attributes, target_type);
    auto it   = annotations_.find(node.id);
    if (it == annotations_.end()) {
      annotation_order_.push_back(node.id);
      annotations_.emplace(node.id, node);
    } else {
      auto& merged = std::get<model::AnnotationNode>(it->second);
      model::MergeAttributes(merged.attributes, node.attributes, policy_);
      if (policy_ == model::AttributePolicy::kLastSeen) merged.target_type = node.target_type;
    }

    model::RelationshipEdge edge;
    edge.from_id                             = from;
    edge.to_id                               = node.id;
    edge.type                                = EdgeType::kUses;
    edge.kind                                = std::string(model::ToString(UsesKind::kAnnotation));
    edge.context                             = context;
    edge.properties["is_external"]           = false;
    edge.properties["resolved"]              = node.fully_qualified_name.find('.') != std::string::npos;
    edge.properties["fully_qualified_name"]  = node.fully_qualified_name;
    edge.properties["target_type"]           = target_type;
    edge.properties["annotation_attributes"] = attributes;
    edge.properties["framework_type"]        = node.framework_type;
    Push(std::move(edge));
  }

  // -------------------------------------------------------------------
  // Helpers
  // -------------------------------------------------------------------

  std::string AnnotationName(const AnnotationUse& use, const std::string& package) const {
    auto name = util::Trim(use.fully_qualified_name().empty() ? use.name() : use.fully_qualified_name());
    if (name.starts_with('@')) name.erase(0, 1);
    if (name.empty() || name.find('.') != std::string::npos) return name;

    if (auto imported = imports_.Lookup(name)) return *imported;
    if (registry_.Contains(identity::GenerateAnnotationId(package, name))) return QualifiedName(package, name);
    if (auto builtin = resolve::BuiltinQualifiedName(name); !builtin.empty()) return builtin;
    return name;
  }

  static std::string TargetId(const resolve::ResolvedType& type) {
    const auto simple = resolve::ExtractSimpleClassName(type.fully_qualified_name);
    if (simple.empty()) return {};
    return identity::GenerateClassId(resolve::ExtractPackageName(type.fully_qualified_name), simple);
  }

  model::PropertyMap TargetProperties(const resolve::ResolvedType& type, const std::string& to) const {
    model::PropertyMap properties;
    properties["is_external"]          = !registry_.Contains(to);
    properties["resolved"]             = type.resolved();
    properties["fully_qualified_name"] = type.fully_qualified_name;
    return properties;
  }

  void Push(model::RelationshipEdge edge) {
    auto key = edge.from_id + '\x1f' + edge.to_id + '\x1f' + std::string(model::ToString(edge.type)) + '\x1f' + edge.kind + '\x1f' + edge.context;
    if (!seen_.insert(std::move(key)).second) return;
    edges_.push_back(std::move(edge));
  }

  const IdRegistry&            registry_;
  const resolve::TypeResolver& resolver_;
  const EntityFactory&         factory_;
  model::AttributePolicy       policy_;
  resolve::ImportTable         imports_;

  std::vector<model::RelationshipEdge>     edges_;
  std::unordered_set<std::string>          seen_;
  std::map<std::string, model::EntityNode> annotations_;
  std::vector<std::string>                 annotation_order_;
};

} // namespace

RelationshipAnalyzer::RelationshipAnalyzer(const IdRegistry& registry, model::AttributePolicy attribute_policy)
    : registry_(registry),
      attribute_policy_(attribute_policy),
      resolver_([&registry](const std::string& fqn) { return registry.HasClass(fqn); }) {
}

AnalysisResult RelationshipAnalyzer::Analyze(const CompilationUnit& unit) const {
  UnitAnalysis analysis(registry_, resolver_, factory_, attribute_policy_, unit);
  for (const auto& entity : unit.entities) {
    analysis.Visit(entity);
  }
  return analysis.Finish();
}

} // namespace codegraph::analysis
