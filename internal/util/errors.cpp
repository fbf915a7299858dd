#include "internal/util/errors.hpp"

namespace relgen::util {

void ThrowIfDbError(const relgen::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto detail  = result.message.empty() ? std::string(relgen::db::ToString(result.code)) : result.message;
  const auto message = context + ": " + detail;
  switch (result.code) {
    case relgen::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case relgen::db::ErrorCode::NotFound:
      throw NotFound(message);
    case relgen::db::ErrorCode::Conflict:
      throw InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace relgen::util
