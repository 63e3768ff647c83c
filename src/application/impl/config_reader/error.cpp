#include "application/impl/config_reader/error.hpp"

CALCFLOW_DEFINE_ERROR_CATEGORY(calcflow::application, ConfigReaderError, e) {
  using E = calcflow::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "The config file is not valid JSON";
    case E::INVALID_VALUE:
      return "A config entry has a value out of its range";
  }
  return "Unknown error";
}
