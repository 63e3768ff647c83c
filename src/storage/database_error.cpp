
#include "storage/database_error.hpp"

CALCFLOW_DEFINE_ERROR_CATEGORY(calcflow::storage, DatabaseError, e) {
  using E = calcflow::storage::DatabaseError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_SUPPORTED:
      return "operation is not supported";
    case E::CORRUPTION:
      return "data corruption";
    case E::INVALID_ARGUMENT:
      return "invalid argument";
    case E::IO_ERROR:
      return "IO error";
    case E::NOT_FOUND:
      return "not found";
    case E::CONSTRAINT_VIOLATION:
      return "constraint violation";
    case E::BUSY:
      return "database is busy";
    case E::CONCURRENCY_VIOLATION:
      return "row is claimed by another driver";
    case E::UNKNOWN:
      break;
  }

  return "unknown error";
}

namespace calcflow::storage {
  std::ostream &operator<<(std::ostream &out, const DatabaseError &error) {
    return out << make_error_code(error).message();
  }
}  // namespace calcflow::storage
