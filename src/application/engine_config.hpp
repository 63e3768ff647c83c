#ifndef CALCFLOW_APPLICATION_ENGINE_CONFIG_HPP
#define CALCFLOW_APPLICATION_ENGINE_CONFIG_HPP

#include <chrono>
#include <string>

#include <spdlog/common.h>

#include "processing/calcjob_runner.hpp"
#include "processing/step_executor.hpp"
#include "remote/firecrest_gateway.hpp"

namespace calcflow::application {

  /**
   * Tunables of the engine, read from <project>/config.json and overridden
   * by command line flags
   */
  struct EngineConfig {
    size_t concurrency = 4;
    size_t max_step_retries = 3;
    std::chrono::milliseconds retry_backoff_initial{1000};
    std::chrono::milliseconds retry_backoff_max{60000};
    std::chrono::milliseconds poll_initial_interval{1000};
    double poll_backoff_factor = 2.0;
    std::chrono::milliseconds poll_max_interval{60000};
    std::chrono::milliseconds status_cache_ttl{500};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::seconds claim_lease{300};
    std::chrono::milliseconds selection_interval{2000};
    spdlog::level::level_enum log_level = spdlog::level::info;

    processing::RunnerOptions runnerOptions() const {
      processing::RunnerOptions options;
      options.concurrency = concurrency;
      options.max_step_retries = max_step_retries;
      options.retry_backoff_initial = retry_backoff_initial;
      options.retry_backoff_max = retry_backoff_max;
      options.selection_interval = selection_interval;
      options.claim_lease = claim_lease;
      return options;
    }

    processing::ExecutorOptions executorOptions() const {
      processing::ExecutorOptions options;
      options.poll_initial_interval = poll_initial_interval;
      options.poll_backoff_factor = poll_backoff_factor;
      options.poll_max_interval = poll_max_interval;
      return options;
    }

    remote::GatewayOptions gatewayOptions() const {
      remote::GatewayOptions options;
      options.request_timeout = request_timeout;
      options.status_cache_ttl = status_cache_ttl;
      return options;
    }
  };

}  // namespace calcflow::application

#endif  // CALCFLOW_APPLICATION_ENGINE_CONFIG_HPP
