
#ifndef CALCFLOW_LOGGER_HPP
#define CALCFLOW_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace calcflow::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Set level of all registered loggers, and of the ones created later
   * @param level - minimal level to output
   */
  void setLogLevel(spdlog::level::level_enum level);

  /**
   * Route loggers created after this call to a file instead of stdout
   * @param path - log file path, empty to restore stdout
   */
  void setLogFile(const std::string &path);
}  // namespace calcflow::base

#endif  // CALCFLOW_LOGGER_HPP
