#include "copr/coprocessor/request_task.h"

#include <glog/logging.h>
#include <google/protobuf/io/coded_stream.h>

#include <utility>
#include <vector>

#include "copr/common/config.h"
#include "copr/common/util.h"
#include "copr/coprocessor/dag/executor.h"
#include "copr/proto/plan.pb.h"

namespace copr {

namespace {

template <typename Message>
Status ParsePayload(const std::string& data, int recursion_limit,
                    Message* msg) {
  google::protobuf::io::CodedInputStream input(
      reinterpret_cast<const uint8_t*>(data.data()),
      static_cast<int>(data.size()));
  input.SetRecursionLimit(recursion_limit);
  if (!msg->ParseFromCodedStream(&input) || !input.ConsumedEntireMessage()) {
    return Status::Other("failed to parse " + msg->GetTypeName());
  }
  return Status::OK();
}

// Ranges must be non-empty, ascending and disjoint. An empty end key is
// unbounded, so only the last range may have one.
Status ValidateRanges(const CopRequest& req) {
  const KeyRange* prev = nullptr;
  for (const auto& range : req.ranges()) {
    if (!range.end().empty() && range.start() >= range.end()) {
      return Status::Other("invalid range " + RangeToString(range));
    }
    if (prev != nullptr &&
        (prev->end().empty() || prev->end() > range.start())) {
      return Status::Other("range " + RangeToString(range) +
                           " is not sorted after " + RangeToString(*prev));
    }
    prev = &range;
  }
  return Status::OK();
}

std::vector<KeyRange> CopyRanges(const CopRequest& req) {
  return std::vector<KeyRange>(req.ranges().begin(), req.ranges().end());
}

}  // namespace

RequestTask::RequestTask(ReqContext req_ctx, bool is_streaming,
                         HandlerBuilder builder)
    : req_ctx_(std::move(req_ctx)),
      is_streaming_(is_streaming),
      priority_(req_ctx_->context.priority()),
      builder_(std::move(builder)) {}

const ReqContext& RequestTask::req_context() const {
  CHECK(req_ctx_.has_value()) << "Request context already handed over";
  return *req_ctx_;
}

Status RequestTask::BuildHandler(std::shared_ptr<storage::Snapshot> snapshot,
                                 std::unique_ptr<RequestHandler>* handler) {
  CHECK(req_ctx_.has_value()) << "Handler already built";
  ReqContext req_ctx = std::move(*req_ctx_);
  req_ctx_.reset();
  return builder_(std::move(req_ctx), std::move(snapshot), handler);
}

Status RequestTask::Build(const CopRequest& req,
                          std::optional<std::string> peer, bool is_streaming,
                          const RequestOptions& options,
                          std::unique_ptr<RequestTask>* task) {
  const char* tag = nullptr;
  std::optional<bool> is_desc_scan;
  std::optional<uint64_t> start_ts;
  HandlerBuilder builder;

  COPR_RETURN_IF_ERROR(ValidateRanges(req));
  switch (req.tp()) {
    case kReqTypeDag: {
      DagRequest dag;
      COPR_RETURN_IF_ERROR(
          ParsePayload(req.data(), options.recursion_limit, &dag));
      COPR_RETURN_IF_ERROR(dag::ValidateExecutors(dag));
      tag = dag::IsIndexScan(dag) ? "index" : "select";
      is_desc_scan = dag::IsDescScan(dag);
      start_ts = dag.start_ts();
      size_t batch_row_limit = is_streaming ? options.stream_batch_row_limit
                                            : options.batch_row_limit;
      builder = [dag = std::move(dag), ranges = CopyRanges(req),
                 batch_row_limit](
                    ReqContext req_ctx,
                    std::shared_ptr<storage::Snapshot> snapshot,
                    std::unique_ptr<RequestHandler>* handler) -> Status {
        std::unique_ptr<dag::Executor> root;
        COPR_RETURN_IF_ERROR(
            dag::BuildExecutors(dag, std::move(snapshot), ranges, &root));
        *handler = std::make_unique<RequestHandler>(
            DagHandler(std::move(req_ctx), std::move(root), batch_row_limit));
        return Status::OK();
      };
      break;
    }
    case kReqTypeAnalyze: {
      if (is_streaming && !AnalyzeHandler::kSupportsStreaming) {
        return Status::Other("streaming analyze request is not supported");
      }
      AnalyzeReq analyze;
      COPR_RETURN_IF_ERROR(
          ParsePayload(req.data(), options.recursion_limit, &analyze));
      tag = analyze.tp() == AnalyzeType::TypeIndex ? "analyze_index"
                                                   : "analyze_table";
      start_ts = analyze.start_ts();
      builder = [analyze = std::move(analyze), ranges = CopyRanges(req)](
                    ReqContext req_ctx,
                    std::shared_ptr<storage::Snapshot> snapshot,
                    std::unique_ptr<RequestHandler>* handler) -> Status {
        const char* kind =
            analyze.tp() == AnalyzeType::TypeIndex ? "idxscan" : "tblscan";
        auto scan = std::make_unique<dag::ScanExecutor>(
            kind, std::move(snapshot), ranges, analyze.start_ts(), false);
        *handler = std::make_unique<RequestHandler>(
            AnalyzeHandler(std::move(req_ctx), analyze, std::move(scan)));
        return Status::OK();
      };
      break;
    }
    case kReqTypeChecksum: {
      if (is_streaming && !ChecksumHandler::kSupportsStreaming) {
        return Status::Other("streaming checksum request is not supported");
      }
      ChecksumRequest checksum;
      COPR_RETURN_IF_ERROR(
          ParsePayload(req.data(), options.recursion_limit, &checksum));
      if (checksum.algorithm() != ChecksumAlgorithm::Crc64_Xor) {
        return Status::Other(
            "unknown checksum algorithm " +
            std::to_string(static_cast<int>(checksum.algorithm())));
      }
      tag = checksum.scan_on() == ChecksumScanOn::Index ? "checksum_index"
                                                        : "checksum_table";
      start_ts = checksum.start_ts();
      builder = [checksum = std::move(checksum), ranges = CopyRanges(req)](
                    ReqContext req_ctx,
                    std::shared_ptr<storage::Snapshot> snapshot,
                    std::unique_ptr<RequestHandler>* handler) -> Status {
        const char* kind = checksum.scan_on() == ChecksumScanOn::Index
                               ? "idxscan"
                               : "tblscan";
        auto scan = std::make_unique<dag::ScanExecutor>(
            kind, std::move(snapshot), ranges, checksum.start_ts(), false);
        *handler = std::make_unique<RequestHandler>(
            ChecksumHandler(std::move(req_ctx), checksum, std::move(scan)));
        return Status::OK();
      };
      break;
    }
    default:
      return Status::Other("unsupported tp " + std::to_string(req.tp()));
  }

  ReqContext req_ctx(tag, req.context(), req.ranges(), std::move(peer),
                     is_desc_scan, start_ts);
  req_ctx.SetMaxHandleDuration(options.max_handle_duration);
  task->reset(
      new RequestTask(std::move(req_ctx), is_streaming, std::move(builder)));
  return Status::OK();
}

}  // namespace copr
