#ifndef CALCFLOW_APPLICATION_CONFIG_READER_ERROR_HPP
#define CALCFLOW_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace calcflow::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE
  };

}  // namespace calcflow::application

CALCFLOW_DECLARE_ERROR(calcflow::application, ConfigReaderError);

#endif  // CALCFLOW_APPLICATION_CONFIG_READER_ERROR_HPP
