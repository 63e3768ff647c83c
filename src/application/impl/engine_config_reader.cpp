#include "application/impl/engine_config_reader.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/pt_util.hpp"

namespace calcflow::application {

  namespace pt = boost::property_tree;

  namespace {
    base::Logger logger() {
      static auto logger = base::createLogger("EngineConfig");
      return logger;
    }

    /// reads a positive integer entry into @param target
    template <typename Target>
    outcome::result<void> readCount(const pt::ptree &tree,
                                    const std::string &key,
                                    Target &target) {
      auto entry = optionalEntry<int64_t>(tree, key);
      if (!entry) {
        logger()->error("'{}' is not an integer", key);
        return outcome::failure(entry.error());
      }
      if (!entry.value()) {
        return outcome::success();
      }
      if (*entry.value() < 0) {
        logger()->error("'{}' must not be negative", key);
        return ConfigReaderError::INVALID_VALUE;
      }
      target = Target(*entry.value());
      return outcome::success();
    }
  }  // namespace

  outcome::result<spdlog::level::level_enum> parseLogLevel(
      const std::string &str) {
    if (str.size() == 1 && str[0] >= '0' && str[0] <= '6') {
      return static_cast<spdlog::level::level_enum>(str[0] - '0');
    }
    auto level = spdlog::level::from_str(str);
    // from_str falls back to off for unknown names
    if (level == spdlog::level::off && !boost::iequals(str, "off")) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return level;
  }

  outcome::result<EngineConfig> EngineConfigReader::readFile(
      const boost::filesystem::path &path) {
    boost::system::error_code ec;
    if (!boost::filesystem::exists(path, ec)) {
      return EngineConfig{};
    }
    boost::filesystem::ifstream in(path);
    if (!in) {
      logger()->error("Cannot open config file {}", path.string());
      return ConfigReaderError::PARSER_ERROR;
    }
    return read(in);
  }

  outcome::result<EngineConfig> EngineConfigReader::read(std::istream &in) {
    pt::ptree tree;
    try {
      pt::read_json(in, tree);
    } catch (const pt::json_parser_error &e) {
      logger()->error("Config is not valid JSON: {}", e.what());
      return ConfigReaderError::PARSER_ERROR;
    }
    return read(tree, EngineConfig{});
  }

  outcome::result<EngineConfig> EngineConfigReader::read(
      const pt::ptree &tree, EngineConfig config) {
    const std::pair<const char *, size_t *> counts[] = {
        {"concurrency", &config.concurrency},
        {"max_step_retries", &config.max_step_retries},
    };
    for (const auto &[key, target] : counts) {
      auto res = readCount(tree, key, *target);
      if (!res) {
        return outcome::failure(res.error());
      }
    }

    const std::pair<const char *, std::chrono::milliseconds *> durations[] = {
        {"retry_backoff_initial_ms", &config.retry_backoff_initial},
        {"retry_backoff_max_ms", &config.retry_backoff_max},
        {"poll_initial_interval_ms", &config.poll_initial_interval},
        {"poll_max_interval_ms", &config.poll_max_interval},
        {"status_cache_ttl_ms", &config.status_cache_ttl},
        {"request_timeout_ms", &config.request_timeout},
        {"selection_interval_ms", &config.selection_interval},
    };
    for (const auto &[key, target] : durations) {
      auto res = readCount(tree, key, *target);
      if (!res) {
        return outcome::failure(res.error());
      }
    }

    auto lease = readCount(tree, "claim_lease_seconds", config.claim_lease);
    if (!lease) {
      return outcome::failure(lease.error());
    }

    auto factor = optionalEntry<double>(tree, "poll_backoff_factor");
    if (!factor) {
      logger()->error("'poll_backoff_factor' is not a number");
      return outcome::failure(factor.error());
    }
    if (factor.value()) {
      config.poll_backoff_factor = *factor.value();
    }

    if (auto level = tree.get_optional<std::string>("log_level")) {
      auto parsed = parseLogLevel(*level);
      if (!parsed) {
        logger()->error("Unknown log level '{}'", *level);
        return outcome::failure(parsed.error());
      }
      config.log_level = parsed.value();
    }

    auto valid = validate(config);
    if (!valid) {
      return outcome::failure(valid.error());
    }
    return config;
  }

  outcome::result<void> EngineConfigReader::validate(
      const EngineConfig &config) {
    if (config.concurrency == 0) {
      logger()->error("'concurrency' must be at least 1");
      return ConfigReaderError::INVALID_VALUE;
    }
    if (config.poll_backoff_factor < 1.0) {
      logger()->error("'poll_backoff_factor' must be at least 1");
      return ConfigReaderError::INVALID_VALUE;
    }
    if (config.poll_initial_interval > config.poll_max_interval
        || config.retry_backoff_initial > config.retry_backoff_max) {
      logger()->error("initial intervals must not exceed their maximum");
      return ConfigReaderError::INVALID_VALUE;
    }
    if (config.claim_lease.count() == 0) {
      logger()->error("'claim_lease_seconds' must be at least 1");
      return ConfigReaderError::INVALID_VALUE;
    }
    return outcome::success();
  }

}  // namespace calcflow::application
