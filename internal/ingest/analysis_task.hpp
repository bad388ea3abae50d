#pragma once

#include <cstddef>

namespace codegraph::analysis {
struct CompilationUnit;
}

namespace codegraph::ingest {

/*
  One compilation unit to analyze.

  `slot` indexes the caller's pre-sized result vector; each task owns
  its slot, so workers never share an output.
*/
struct AnalysisTask {
  const analysis::CompilationUnit* unit = nullptr;
  std::size_t                      slot = 0;
};

} // namespace codegraph::ingest
