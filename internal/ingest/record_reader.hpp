#pragma once

#include <istream>
#include <string>
#include <vector>

#include "codegraph/ingest/v1/records.pb.h"

namespace codegraph::ingest {

/*
  Reads parser output: newline-delimited JSON, one ParsedEntity per
  line, in protobuf JSON mapping. Blank lines are skipped.

  A malformed line throws util::InvalidArgument naming its 1-based
  line number.
*/
class RecordReader {
 public:
  static std::vector<v1::ParsedEntity> Read(std::istream& in);

  static std::vector<v1::ParsedEntity> ReadFile(const std::string& path);
};

} // namespace codegraph::ingest
