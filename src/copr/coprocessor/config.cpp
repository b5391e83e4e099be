#include "copr/coprocessor/config.h"

namespace copr {

CoprocessorConfig CoprocessorConfig::FromYaml(const YAML::Node& config) {
  CoprocessorConfig cfg;

  const auto& readpool = config["readpool"];
  if (readpool) {
    cfg.high_concurrency =
        readpool["high_concurrency"].as<size_t>(cfg.high_concurrency);
    cfg.normal_concurrency =
        readpool["normal_concurrency"].as<size_t>(cfg.normal_concurrency);
    cfg.low_concurrency =
        readpool["low_concurrency"].as<size_t>(cfg.low_concurrency);
    cfg.max_tasks_per_worker =
        readpool["max_tasks_per_worker"].as<size_t>(cfg.max_tasks_per_worker);
  }

  const auto& endpoint = config["endpoint"];
  if (endpoint) {
    cfg.recursion_limit =
        endpoint["recursion_limit"].as<int>(cfg.recursion_limit);
    cfg.batch_row_limit =
        endpoint["batch_row_limit"].as<size_t>(cfg.batch_row_limit);
    cfg.stream_batch_row_limit = endpoint["stream_batch_row_limit"].as<size_t>(
        cfg.stream_batch_row_limit);
    cfg.request_max_handle_duration = std::chrono::milliseconds(
        endpoint["request_max_handle_duration_ms"].as<long>(
            cfg.request_max_handle_duration.count()));
    cfg.slow_log_threshold = std::chrono::milliseconds(
        endpoint["slow_log_threshold_ms"].as<long>(
            cfg.slow_log_threshold.count()));
  }
  return cfg;
}

Status CoprocessorConfig::Validate() const {
  if (high_concurrency == 0 || normal_concurrency == 0 ||
      low_concurrency == 0) {
    return Status::Other("read pool concurrency must be positive");
  }
  if (max_tasks_per_worker == 0) {
    return Status::Other("max_tasks_per_worker must be positive");
  }
  if (recursion_limit <= 0) {
    return Status::Other("recursion_limit must be positive");
  }
  if (batch_row_limit == 0 || stream_batch_row_limit == 0) {
    return Status::Other("row limits must be positive");
  }
  if (request_max_handle_duration.count() <= 0) {
    return Status::Other("request_max_handle_duration_ms must be positive");
  }
  return Status::OK();
}

}  // namespace copr
