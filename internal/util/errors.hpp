#pragma once

#include <stdexcept>
#include <string>

namespace codegraph::util {

/*
  Central error types.

  Per-node upsert failures are reported through UpsertResult; only these
  escape as exceptions (bad identifier input, configuration, transport).
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceFailure : public std::runtime_error {
 public:
  explicit PersistenceFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfiguration : public std::runtime_error {
 public:
  explicit InvalidConfiguration(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace codegraph::util
