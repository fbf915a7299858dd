#pragma once

#include <string>
#include <string_view>

namespace relgen::db {

/*
  Store result codes shared by every backend.

  Backends map sqlite3 / pqxx failures onto these codes, so the
  extraction layer never sees a backend error type.

  AlreadyExists is what an insert-or-ignore returns for a mention or
  candidate whose unique key is taken. Callers that insert generated
  records treat it as a skip (see Result::IsDuplicate).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::InternalError: return "internal error";
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

  // insert-or-ignore hit an existing unique key
  bool IsDuplicate() const {
    return code == ErrorCode::AlreadyExists;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace relgen::db
