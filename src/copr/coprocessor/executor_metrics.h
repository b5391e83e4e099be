#ifndef COPR_COPROCESSOR_EXECUTOR_METRICS_H_
#define COPR_COPROCESSOR_EXECUTOR_METRICS_H_

#include <cstdint>
#include <map>
#include <string>

#include "copr/proto/coprocessor.pb.h"
#include "copr/storage/statistics.h"

namespace copr {

struct ScanCounter {
  int64_t range = 0;
  int64_t point = 0;

  void Add(const ScanCounter& other) {
    range += other.range;
    point += other.point;
  }
};

/*!
 * \brief Execution statistics of a handler. Merging is additive: a handler
 *   must be merged into an accumulator exactly once.
 */
struct ExecutorMetrics {
  storage::ScanStatistics cf_stats;
  ScanCounter scan_counter;
  // Executor kind -> number of instances built.
  std::map<std::string, int64_t> executor_count;

  void Merge(const ExecutorMetrics& other);
  void ToScanDetail(ScanDetail* detail) const;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_EXECUTOR_METRICS_H_
