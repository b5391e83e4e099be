#include "copr/coprocessor/dag_handler.h"

#include <glog/logging.h>

#include <utility>

#include "copr/proto/plan.pb.h"

namespace copr {

DagHandler::DagHandler(ReqContext req_ctx,
                       std::unique_ptr<dag::Executor> executor,
                       size_t batch_row_limit)
    : HandlerBase(std::move(req_ctx)),
      executor_(std::move(executor)),
      batch_row_limit_(batch_row_limit) {
  CHECK_GT(batch_row_limit_, 0u);
}

Status DagHandler::HandleRequest(CopResponse* resp) {
  COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
  SelectResponse sel;
  Chunk* chunk = nullptr;
  for (;;) {
    std::optional<Row> row;
    COPR_RETURN_IF_ERROR(executor_->Next(&row));
    if (!row.has_value()) {
      break;
    }
    if (chunk == nullptr ||
        static_cast<size_t>(chunk->rows_size()) >= batch_row_limit_) {
      if (chunk != nullptr) {
        COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
      }
      chunk = sel.add_chunks();
    }
    *chunk->add_rows() = std::move(*row);
  }
  resp->set_data(sel.SerializeAsString());
  return Status::OK();
}

Status DagHandler::HandleStreamingRequest(std::optional<CopResponse>* resp,
                                          bool* has_more) {
  resp->reset();
  *has_more = false;
  COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());

  Chunk chunk;
  bool finished = false;
  while (static_cast<size_t>(chunk.rows_size()) < batch_row_limit_) {
    std::optional<Row> row;
    COPR_RETURN_IF_ERROR(executor_->Next(&row));
    if (!row.has_value()) {
      finished = true;
      break;
    }
    *chunk.add_rows() = std::move(*row);
  }
  if (chunk.rows_size() == 0) {
    return Status::OK();
  }

  SelectResponse sel;
  *sel.add_chunks() = std::move(chunk);
  resp->emplace();
  (*resp)->set_data(sel.SerializeAsString());
  executor_->TakeScannedRange((*resp)->mutable_range());
  *has_more = !finished;
  return Status::OK();
}

void DagHandler::CollectMetricsInto(ExecutorMetrics* metrics) {
  executor_->CollectMetricsInto(metrics);
}

}  // namespace copr
