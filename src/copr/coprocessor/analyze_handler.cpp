#include "copr/coprocessor/analyze_handler.h"

#include <glog/logging.h>

#include <algorithm>
#include <utility>

namespace copr {

AnalyzeHandler::AnalyzeHandler(ReqContext req_ctx, AnalyzeReq req,
                               std::unique_ptr<dag::Executor> scan)
    : HandlerBase(std::move(req_ctx)),
      req_(std::move(req)),
      scan_(std::move(scan)) {}

Status AnalyzeHandler::HandleRequest(CopResponse* resp) {
  COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
  bool by_index = req_.tp() == AnalyzeType::TypeIndex;
  std::vector<std::string> values;
  for (;;) {
    std::optional<Row> row;
    COPR_RETURN_IF_ERROR(scan_->Next(&row));
    if (!row.has_value()) {
      break;
    }
    values.push_back(by_index ? std::move(*row->mutable_key())
                              : std::move(*row->mutable_value()));
    if (values.size() % kDeadlineCheckRows == 0) {
      COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
    }
  }
  // Index keys already come in order.
  if (!by_index) {
    std::sort(values.begin(), values.end());
  }

  uint32_t bucket_size =
      req_.bucket_size() > 0 ? req_.bucket_size() : kDefaultBucketSize;
  AnalyzeResp analyze;
  BuildHistogram(values, bucket_size, analyze.mutable_hist());
  analyze.set_total_count(values.size());
  VLOG(1) << req_ctx_.tag << ": " << values.size() << " values, ndv "
          << analyze.hist().ndv() << ", " << analyze.hist().buckets_size()
          << " buckets";
  resp->set_data(analyze.SerializeAsString());
  return Status::OK();
}

void AnalyzeHandler::CollectMetricsInto(ExecutorMetrics* metrics) {
  scan_->CollectMetricsInto(metrics);
}

void AnalyzeHandler::BuildHistogram(const std::vector<std::string>& values,
                                    uint32_t bucket_size, Histogram* hist) {
  CHECK_GT(bucket_size, 0u);
  hist->Clear();
  if (values.empty()) {
    return;
  }
  int64_t depth = (static_cast<int64_t>(values.size()) + bucket_size - 1) /
                  bucket_size;
  int64_t ndv = 0;
  int64_t count = 0;
  // Cumulative count before the last bucket.
  int64_t bucket_begin = 0;
  Bucket* last = nullptr;
  for (const auto& value : values) {
    ++count;
    if (last != nullptr && value == last->upper_bound()) {
      last->set_count(count);
      last->set_repeats(last->repeats() + 1);
      continue;
    }
    ++ndv;
    if (last == nullptr || last->count() - bucket_begin >= depth) {
      if (last != nullptr) {
        bucket_begin = last->count();
      }
      last = hist->add_buckets();
      last->set_lower_bound(value);
    }
    last->set_upper_bound(value);
    last->set_count(count);
    last->set_repeats(1);
  }
  hist->set_ndv(ndv);
}

}  // namespace copr
