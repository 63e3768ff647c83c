#ifndef CALCFLOW_STORAGE_LOADER_ERROR_HPP
#define CALCFLOW_STORAGE_LOADER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace calcflow::storage {

  /**
   * @brief errors of the bulk loader, the offending item is logged
   */
  enum class LoaderError : int {
    INVALID_DOCUMENT = 1,  ///< not JSON, or wrong top level shape
    INVALID_ITEM,          ///< an item has a missing or mistyped field
    UNKNOWN_LABEL,         ///< a client, code or object label is not defined
    MISSING_OBJECT,        ///< an upload key is not in the content store
    UNREADABLE_FILE,       ///< a file to load cannot be read
    REJECTED,              ///< the metadata store refused an item
  };

}  // namespace calcflow::storage

CALCFLOW_DECLARE_ERROR(calcflow::storage, LoaderError);

#endif  // CALCFLOW_STORAGE_LOADER_ERROR_HPP
