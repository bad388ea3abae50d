#include "internal/ingest/record_reader.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::ingest {

std::vector<v1::ParsedEntity> RecordReader::Read(std::istream& in) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  std::vector<v1::ParsedEntity> records;
  std::string                   line;
  std::size_t                   line_number = 0;

  while (std::getline(in, line)) {
    ++line_number;
    if (util::Trim(line).empty()) continue;

    v1::ParsedEntity record;
    auto             status = google::protobuf::util::JsonStringToMessage(line, &record, options);
    if (!status.ok()) {
      throw util::InvalidArgument("Malformed record at line " + std::to_string(line_number) + ": " + std::string(status.message()));
    }
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<v1::ParsedEntity> RecordReader::ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::InvalidArgument("Cannot open records file: " + path);
  }
  return Read(in);
}

} // namespace codegraph::ingest
