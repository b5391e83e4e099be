#include "copr/coprocessor/tracker.h"

#include <glog/logging.h>

#include "copr/common/util.h"

namespace copr {

Tracker::Tracker(const ReqContext& req_ctx,
                 std::chrono::nanoseconds slow_log_threshold)
    : tag_(req_ctx.tag),
      region_id_(req_ctx.context.region_id()),
      peer_(req_ctx.peer),
      txn_start_ts_(req_ctx.txn_start_ts),
      first_range_(req_ctx.first_range),
      ranges_len_(req_ctx.ranges_len),
      slow_log_threshold_(slow_log_threshold),
      request_begin_at_(Clock::now()) {}

void Tracker::OnStepBegin() {
  CHECK(!step_begin_at_.has_value()) << "Step of " << tag_ << " already begun";
  auto now = Clock::now();
  if (!started_) {
    started_ = true;
    wait_time_ = now - request_begin_at_;
  }
  step_begin_at_ = now;
}

void Tracker::OnStepEnd() {
  if (!step_begin_at_.has_value()) {
    return;
  }
  handle_time_ += Clock::now() - *step_begin_at_;
  step_begin_at_.reset();
}

void Tracker::FillExecDetails(const Context& ctx, ExecDetails* details) const {
  if (ctx.handle_time()) {
    auto* handle_time = details->mutable_handle_time();
    handle_time->set_wait_ms(ToMillis(wait_time_));
    handle_time->set_process_ms(ToMillis(handle_time_));
  }
  if (ctx.scan_detail()) {
    exec_metrics_.ToScanDetail(details->mutable_scan_detail());
  }
}

void Tracker::OnFinish(MetricsSink* sink) {
  CHECK(!finished_) << "Request " << tag_ << " finished twice";
  finished_ = true;
  OnStepEnd();
  auto total = Clock::now() - request_begin_at_;
  if (total >= slow_log_threshold_) {
    LogSlowQuery(total);
  }
  if (sink != nullptr) {
    sink->ReportDurations(tag_, wait_time_, handle_time_);
    sink->ReportExecutorMetrics(tag_, exec_metrics_);
  }
}

void Tracker::LogSlowQuery(std::chrono::nanoseconds total) const {
  LOG(INFO) << "[region " << region_id_ << "] slow-query:" << tag_
            << " start_ts:"
            << (txn_start_ts_.has_value() ? std::to_string(*txn_start_ts_)
                                          : "none")
            << " peer:" << peer_.value_or("unknown")
            << " total_lat:" << ToMillis(total) << "ms"
            << " handle_lat:" << ToMillis(handle_time_) << "ms"
            << " wait_lat:" << ToMillis(wait_time_) << "ms"
            << " scan_total:" << exec_metrics_.cf_stats.total
            << " scan_processed:" << exec_metrics_.cf_stats.processed
            << " first_range:"
            << (first_range_.has_value() ? RangeToString(*first_range_)
                                         : "none")
            << " ranges_len:" << ranges_len_;
}

}  // namespace copr
