#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace relgen::util {

/*
  Central error types.

  ConfigurationError is raised before any document is touched.
  The others are raised while processing a document and are
  isolated per document by the runner.
*/

class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& msg) : std::invalid_argument(msg) {
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Translate a failed repository result into the matching exception.
void ThrowIfDbError(const relgen::db::Result& result, const std::string& context);

} // namespace relgen::util
