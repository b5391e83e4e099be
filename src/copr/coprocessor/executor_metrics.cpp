#include "copr/coprocessor/executor_metrics.h"

namespace copr {

void ExecutorMetrics::Merge(const ExecutorMetrics& other) {
  cf_stats.Add(other.cf_stats);
  scan_counter.Add(other.scan_counter);
  for (const auto& [kind, count] : other.executor_count) {
    executor_count[kind] += count;
  }
}

void ExecutorMetrics::ToScanDetail(ScanDetail* detail) const {
  detail->set_total(cf_stats.total);
  detail->set_processed(cf_stats.processed);
}

}  // namespace copr
