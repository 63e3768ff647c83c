#ifndef CALCFLOW_SRC_STORAGE_DATABASE_ERROR_HPP
#define CALCFLOW_SRC_STORAGE_DATABASE_ERROR_HPP

#include <ostream>

#include "outcome/outcome.hpp"

namespace calcflow::storage {

  /**
   * @brief error of the content store and of the metadata store
   */
  enum class DatabaseError : int {
    OK = 0,
    NOT_FOUND = 1,
    CORRUPTION = 2,
    NOT_SUPPORTED = 3,
    INVALID_ARGUMENT = 4,
    IO_ERROR = 5,
    CONSTRAINT_VIOLATION = 6,
    BUSY = 7,
    CONCURRENCY_VIOLATION = 8,

    UNKNOWN = 1000
  };
  std::ostream &operator<<(std::ostream &out, const DatabaseError &error);
}  // namespace calcflow::storage

CALCFLOW_DECLARE_ERROR(calcflow::storage, DatabaseError);

#endif  // CALCFLOW_SRC_STORAGE_DATABASE_ERROR_HPP
