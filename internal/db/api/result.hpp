#pragma once

#include <string>
#include <string_view>

namespace sbomgraph::db {

/*
  Outcome of a repository write.

  Backends translate their native errors (sqlite result codes, pqxx
  exceptions) into these; callers never see backend types. Reads do not
  use Result: they throw util::DataAccessError.
*/

enum class ErrorCode {
  OK = 0,

  // primary key or unique index already holds the row
  AlreadyExists,
  // foreign key or NOT NULL violated
  ConstraintViolation,
  // write through a BeginRead() transaction
  ReadOnly,

  Busy,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::ReadOnly: return "read_only";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  static Result ReadOnlyTransaction() {
    return Err(ErrorCode::ReadOnly, "write through a read transaction");
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace sbomgraph::db
