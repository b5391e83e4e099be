#ifndef COPR_COPROCESSOR_TRACKER_H_
#define COPR_COPROCESSOR_TRACKER_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "copr/common/time_util.h"
#include "copr/coprocessor/executor_metrics.h"
#include "copr/coprocessor/metrics.h"
#include "copr/coprocessor/req_context.h"

namespace copr {

/*!
 * \brief Follows one request from arrival to completion: wait time, handle
 *   time summed over its steps, and the executor statistics merged at the end.
 */
class Tracker {
 public:
  Tracker(const ReqContext& req_ctx,
          std::chrono::nanoseconds slow_log_threshold);

  void OnStepBegin();
  void OnStepEnd();

  ExecutorMetrics* mutable_exec_metrics() { return &exec_metrics_; }
  std::chrono::nanoseconds wait_time() const { return wait_time_; }
  std::chrono::nanoseconds handle_time() const { return handle_time_; }

  /*! \brief Fills the details asked for by the rpc context. */
  void FillExecDetails(const Context& ctx, ExecDetails* details) const;

  /*! \brief Reports to `sink` and logs the request if it was slow. */
  void OnFinish(MetricsSink* sink);

 private:
  void LogSlowQuery(std::chrono::nanoseconds total) const;

  const char* tag_;
  uint64_t region_id_;
  std::optional<std::string> peer_;
  std::optional<uint64_t> txn_start_ts_;
  std::optional<KeyRange> first_range_;
  size_t ranges_len_;
  std::chrono::nanoseconds slow_log_threshold_;

  TimePoint request_begin_at_;
  std::optional<TimePoint> step_begin_at_;
  bool started_ = false;
  bool finished_ = false;
  std::chrono::nanoseconds wait_time_{0};
  std::chrono::nanoseconds handle_time_{0};
  ExecutorMetrics exec_metrics_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_TRACKER_H_
