#include "storage/loader_error.hpp"

CALCFLOW_DEFINE_ERROR_CATEGORY(calcflow::storage, LoaderError, e) {
  using E = calcflow::storage::LoaderError;
  switch (e) {
    case E::INVALID_DOCUMENT:
      return "invalid document";
    case E::INVALID_ITEM:
      return "invalid item";
    case E::UNKNOWN_LABEL:
      return "unknown label";
    case E::MISSING_OBJECT:
      return "object not found in the content store";
    case E::UNREADABLE_FILE:
      return "file cannot be read";
    case E::REJECTED:
      return "item rejected by the database";
  }
  return "unknown loader error";
}
