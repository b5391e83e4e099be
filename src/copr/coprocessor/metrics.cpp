#include "copr/coprocessor/metrics.h"

#include <glog/logging.h>

#include <algorithm>

#include "copr/common/time_util.h"

namespace copr {

void CopMetrics::ReportExecutorMetrics(const char* tag,
                                       const ExecutorMetrics& metrics) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_[tag].exec.Merge(metrics);
}

void CopMetrics::ReportDurations(const char* tag, std::chrono::nanoseconds wait,
                                 std::chrono::nanoseconds handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stats = stats_[tag];
  ++stats.requests;
  stats.total_wait += wait;
  stats.total_handle += handle;
  stats.max_handle = std::max(stats.max_handle, handle);
}

void CopMetrics::ReportError(const char* tag, const char* kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_[tag].errors[kind];
}

CopMetrics::TagStats CopMetrics::Get(const std::string& tag) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = stats_.find(tag);
  if (iter == stats_.end()) {
    return TagStats();
  }
  return iter->second;
}

std::vector<std::string> CopMetrics::Tags() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> tags;
  for (const auto& item : stats_) {
    tags.push_back(item.first);
  }
  return tags;
}

void CopMetrics::DumpToLog() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [tag, stats] : stats_) {
    int64_t avg_handle_us =
        stats.requests > 0
            ? std::chrono::duration_cast<std::chrono::microseconds>(
                  stats.total_handle)
                      .count() /
                  stats.requests
            : 0;
    LOG(INFO) << "[" << tag << "] requests=" << stats.requests
              << " avg_handle_us=" << avg_handle_us
              << " max_handle_ms=" << ToMillis(stats.max_handle)
              << " scan_total=" << stats.exec.cf_stats.total
              << " scan_processed=" << stats.exec.cf_stats.processed
              << " range_scans=" << stats.exec.scan_counter.range
              << " point_gets=" << stats.exec.scan_counter.point;
    for (const auto& [kind, count] : stats.errors) {
      LOG(INFO) << "[" << tag << "] error " << kind << "=" << count;
    }
  }
}

}  // namespace copr
