#ifndef COPR_COPROCESSOR_CONFIG_H_
#define COPR_COPROCESSOR_CONFIG_H_

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstddef>
#include <string>

#include "copr/common/config.h"
#include "copr/common/status.h"

namespace copr {

struct CoprocessorConfig {
  // Read pool
  size_t high_concurrency = kDefaultReadPoolConcurrency;
  size_t normal_concurrency = kDefaultReadPoolConcurrency;
  size_t low_concurrency = kDefaultReadPoolConcurrency;
  size_t max_tasks_per_worker = kDefaultMaxTasksPerWorker;

  // Endpoint
  int recursion_limit = kDefaultRecursionLimit;
  size_t batch_row_limit = kDefaultBatchRowLimit;
  size_t stream_batch_row_limit = kDefaultStreamBatchRowLimit;
  std::chrono::milliseconds request_max_handle_duration =
      std::chrono::seconds(kDefaultRequestMaxHandleSecs);
  std::chrono::milliseconds slow_log_threshold =
      std::chrono::milliseconds(kDefaultSlowLogThresholdMs);

  /*! \brief Reads the `readpool` and `endpoint` sections. Missing keys keep
   *   their defaults. */
  static CoprocessorConfig FromYaml(const YAML::Node& config);

  Status Validate() const;

  size_t TotalWorkers() const {
    return high_concurrency + normal_concurrency + low_concurrency;
  }

  size_t MaxRunningTaskCount() const {
    return max_tasks_per_worker * TotalWorkers();
  }
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_CONFIG_H_
