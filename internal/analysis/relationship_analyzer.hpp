#pragma once

#include "internal/analysis/compilation_unit.hpp"
#include "internal/analysis/entity_factory.hpp"
#include "internal/analysis/id_registry.hpp"
#include "internal/model/upsert_mode.hpp"
#include "internal/resolve/type_resolver.hpp"

namespace codegraph::analysis {

/*
  Derives relationship edges for one compilation unit.

  Edge kinds and their origin:
    CONTAINS    package/module/repository -> class/package/module,
                class -> method/field (both endpoints minted)
    EXTENDS     class -> superclass
    IMPLEMENTS  class -> interface
    USES        class -> type for import, field_type, method_return,
                method_param, generic_param, instantiation, method_call;
                method -> field for field_access;
                annotated element -> annotation for annotation
    CALLS       method -> method on a single name + arity match

  Targets that were not minted in this ingestion still produce an edge,
  pointing at the class id of the best-guess name with is_external=true.

  Reads the registry only; Analyze may run concurrently for different
  units against the same analyzer.
*/
class RelationshipAnalyzer {
 public:
  RelationshipAnalyzer(const IdRegistry& registry, model::AttributePolicy attribute_policy);

  AnalysisResult Analyze(const CompilationUnit& unit) const;

 private:
  const IdRegistry&      registry_;
  model::AttributePolicy attribute_policy_;
  resolve::TypeResolver  resolver_;
  EntityFactory          factory_;
};

} // namespace codegraph::analysis
