#pragma once

#include <stdexcept>
#include <string>

namespace sbomgraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes.

  Structural problems inside one SBOM (dangling relationship endpoints,
  unresolvable external references, cycles) are never reported through
  these; they are tolerated and logged where they are found.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Query or transport failure of the data-access layer. Fatal to the request.
class DataAccessError : public std::runtime_error {
 public:
  explicit DataAccessError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sbomgraph::util
