#include "copr/coprocessor/dag/executor.h"

#include <glog/logging.h>

#include <utility>

#include "copr/common/util.h"

namespace copr {
namespace dag {

ScanExecutor::ScanExecutor(const char* kind,
                           std::shared_ptr<storage::Snapshot> snapshot,
                           std::vector<KeyRange> ranges, uint64_t start_ts,
                           bool desc)
    : snapshot_(std::move(snapshot)),
      ranges_(std::move(ranges)),
      start_ts_(start_ts),
      desc_(desc) {
  metrics_.executor_count[kind] += 1;
}

const KeyRange& ScanExecutor::CurrentRange() const {
  return desc_ ? ranges_[ranges_.size() - 1 - range_idx_]
               : ranges_[range_idx_];
}

void ScanExecutor::Emit(std::string key, std::string value,
                        std::optional<Row>* row) {
  if (!first_key_.has_value()) {
    first_key_ = key;
  }
  last_key_ = key;
  row->emplace();
  (*row)->set_key(std::move(key));
  (*row)->set_value(std::move(value));
}

Status ScanExecutor::Next(std::optional<Row>* row) {
  row->reset();
  while (range_idx_ < ranges_.size()) {
    const KeyRange& range = CurrentRange();
    if (IsPointRange(range)) {
      ++range_idx_;
      ++metrics_.scan_counter.point;
      std::optional<std::string> value;
      COPR_RETURN_IF_ERROR(
          snapshot_->Get(range.start(), start_ts_, &value, &metrics_.cf_stats));
      if (value.has_value()) {
        Emit(range.start(), std::move(*value), row);
        return Status::OK();
      }
      continue;
    }

    if (scanner_ == nullptr) {
      scanner_ = snapshot_->NewScanner(range, start_ts_, desc_);
      ++metrics_.scan_counter.range;
    }
    std::optional<storage::KvPair> kv;
    COPR_RETURN_IF_ERROR(scanner_->Next(&kv));
    if (kv.has_value()) {
      Emit(std::move(kv->first), std::move(kv->second), row);
      return Status::OK();
    }
    scanner_->CollectStatisticsInto(&metrics_.cf_stats);
    scanner_.reset();
    ++range_idx_;
  }
  return Status::OK();
}

void ScanExecutor::CollectMetricsInto(ExecutorMetrics* metrics) {
  if (scanner_ != nullptr) {
    scanner_->CollectStatisticsInto(&metrics_.cf_stats);
  }
  metrics->Merge(metrics_);
}

bool ScanExecutor::TakeScannedRange(KeyRange* range) {
  if (!first_key_.has_value()) {
    return false;
  }
  if (desc_) {
    range->set_start(*last_key_);
    range->set_end(NextKey(*first_key_));
  } else {
    range->set_start(*first_key_);
    range->set_end(NextKey(*last_key_));
  }
  first_key_.reset();
  last_key_.reset();
  return true;
}

LimitExecutor::LimitExecutor(uint64_t limit, std::unique_ptr<Executor> src)
    : limit_(limit), src_(std::move(src)) {}

Status LimitExecutor::Next(std::optional<Row>* row) {
  row->reset();
  if (cursor_ >= limit_) {
    return Status::OK();
  }
  COPR_RETURN_IF_ERROR(src_->Next(row));
  if (row->has_value()) {
    ++cursor_;
  }
  return Status::OK();
}

void LimitExecutor::CollectMetricsInto(ExecutorMetrics* metrics) {
  src_->CollectMetricsInto(metrics);
  metrics->executor_count["limit"] += 1;
}

bool LimitExecutor::TakeScannedRange(KeyRange* range) {
  return src_->TakeScannedRange(range);
}

bool IsIndexScan(const DagRequest& dag) {
  return dag.executors_size() > 0 &&
         dag.executors(0).tp() == ExecType::TypeIndexScan;
}

bool IsDescScan(const DagRequest& dag) {
  if (dag.executors_size() == 0) {
    return false;
  }
  const auto& first = dag.executors(0);
  return IsIndexScan(dag) ? first.idx_scan().desc() : first.tbl_scan().desc();
}

Status ValidateExecutors(const DagRequest& dag) {
  if (dag.executors_size() == 0) {
    return Status::Other("dag request has no executor");
  }
  for (int i = 0; i < dag.executors_size(); ++i) {
    ExecType tp = dag.executors(i).tp();
    bool is_scan =
        tp == ExecType::TypeTableScan || tp == ExecType::TypeIndexScan;
    if (i == 0 && !is_scan) {
      return Status::Other("first executor must be a scan, got " +
                           ExecType_Name(tp));
    }
    if (i > 0 && tp != ExecType::TypeLimit) {
      return Status::Other("unsupported executor " + ExecType_Name(tp) +
                           " at position " + std::to_string(i));
    }
  }
  return Status::OK();
}

Status BuildExecutors(const DagRequest& dag,
                      std::shared_ptr<storage::Snapshot> snapshot,
                      std::vector<KeyRange> ranges,
                      std::unique_ptr<Executor>* root) {
  COPR_RETURN_IF_ERROR(ValidateExecutors(dag));
  const char* kind = IsIndexScan(dag) ? "idxscan" : "tblscan";
  std::unique_ptr<Executor> exec = std::make_unique<ScanExecutor>(
      kind, std::move(snapshot), std::move(ranges), dag.start_ts(),
      IsDescScan(dag));
  for (int i = 1; i < dag.executors_size(); ++i) {
    exec = std::make_unique<LimitExecutor>(dag.executors(i).limit().limit(),
                                           std::move(exec));
  }
  VLOG(1) << "Built " << dag.executors_size() << " executors, first "
          << kind;
  *root = std::move(exec);
  return Status::OK();
}

}  // namespace dag
}  // namespace copr
