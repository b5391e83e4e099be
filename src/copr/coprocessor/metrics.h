#ifndef COPR_COPROCESSOR_METRICS_H_
#define COPR_COPROCESSOR_METRICS_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "copr/coprocessor/executor_metrics.h"

namespace copr {

/*!
 * \brief Receives per-request statistics keyed by request tag. Reports from
 *   concurrent tasks may arrive in parallel.
 */
class MetricsSink {
 public:
  virtual ~MetricsSink() = default;
  virtual void ReportExecutorMetrics(const char* tag,
                                     const ExecutorMetrics& metrics) = 0;
  /*! \brief Called once per finished request. */
  virtual void ReportDurations(const char* tag, std::chrono::nanoseconds wait,
                               std::chrono::nanoseconds handle) = 0;
  virtual void ReportError(const char* tag, const char* kind) = 0;
};

/*! \brief In-memory accumulator of coprocessor statistics. */
class CopMetrics : public MetricsSink {
 public:
  struct TagStats {
    int64_t requests = 0;
    ExecutorMetrics exec;
    std::chrono::nanoseconds total_wait{0};
    std::chrono::nanoseconds total_handle{0};
    std::chrono::nanoseconds max_handle{0};
    // Error kind -> count
    std::map<std::string, int64_t> errors;
  };

  void ReportExecutorMetrics(const char* tag,
                             const ExecutorMetrics& metrics) override;
  void ReportDurations(const char* tag, std::chrono::nanoseconds wait,
                       std::chrono::nanoseconds handle) override;
  void ReportError(const char* tag, const char* kind) override;

  /*! \brief Snapshot of the statistics of `tag`. Zeroes if never reported. */
  TagStats Get(const std::string& tag) const;
  std::vector<std::string> Tags() const;
  void DumpToLog() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, TagStats> stats_ /* GUARDED_BY(mutex_) */;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_METRICS_H_
