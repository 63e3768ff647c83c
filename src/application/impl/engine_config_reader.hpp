#ifndef CALCFLOW_APPLICATION_ENGINE_CONFIG_READER_HPP
#define CALCFLOW_APPLICATION_ENGINE_CONFIG_READER_HPP

#include <istream>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/property_tree/ptree.hpp>

#include "application/engine_config.hpp"
#include "application/impl/config_reader/error.hpp"
#include "base/logger.hpp"

namespace calcflow::application {

  /**
   * Reads an EngineConfig from a JSON document. Absent keys keep their
   * defaults, unknown keys are ignored.
   */
  class EngineConfigReader {
   public:
    /// an absent file yields the defaults
    static outcome::result<EngineConfig> readFile(
        const boost::filesystem::path &path);

    static outcome::result<EngineConfig> read(std::istream &in);

    /// applies the entries of @param tree on top of @param config
    static outcome::result<EngineConfig> read(
        const boost::property_tree::ptree &tree, EngineConfig config);

    /// rejects values the engine cannot run with
    static outcome::result<void> validate(const EngineConfig &config);
  };

  /**
   * Parses a log level given by name ("trace" .. "critical", "off") or as a
   * number, 0 for trace up to 6 for off
   */
  outcome::result<spdlog::level::level_enum> parseLogLevel(
      const std::string &str);

}  // namespace calcflow::application

#endif  // CALCFLOW_APPLICATION_ENGINE_CONFIG_READER_HPP
