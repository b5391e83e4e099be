#include "copr/coprocessor/checksum_handler.h"

#include <boost/crc.hpp>
#include <utility>

namespace copr {

namespace {

using Crc64 = boost::crc_optimal<64, 0x42F0E1EBA9EA3693ULL,
                                 0xFFFFFFFFFFFFFFFFULL,
                                 0xFFFFFFFFFFFFFFFFULL, true, true>;

}  // namespace

ChecksumHandler::ChecksumHandler(ReqContext req_ctx, ChecksumRequest req,
                                 std::unique_ptr<dag::Executor> scan)
    : HandlerBase(std::move(req_ctx)),
      req_(std::move(req)),
      scan_(std::move(scan)) {}

uint64_t ChecksumHandler::Digest(const std::string& key,
                                 const std::string& value) {
  Crc64 crc;
  crc.process_bytes(key.data(), key.size());
  crc.process_bytes(value.data(), value.size());
  return crc.checksum();
}

Status ChecksumHandler::HandleRequest(CopResponse* resp) {
  COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
  ChecksumResponse checksum;
  uint64_t value = 0;
  uint64_t total_kvs = 0;
  uint64_t total_bytes = 0;
  for (;;) {
    std::optional<Row> row;
    COPR_RETURN_IF_ERROR(scan_->Next(&row));
    if (!row.has_value()) {
      break;
    }
    value ^= Digest(row->key(), row->value());
    ++total_kvs;
    total_bytes += row->key().size() + row->value().size();
    if (total_kvs % kDeadlineCheckRows == 0) {
      COPR_RETURN_IF_ERROR(req_ctx_.deadline.CheckIfExceeded());
    }
  }
  checksum.set_checksum(value);
  checksum.set_total_kvs(total_kvs);
  checksum.set_total_bytes(total_bytes);
  resp->set_data(checksum.SerializeAsString());
  return Status::OK();
}

void ChecksumHandler::CollectMetricsInto(ExecutorMetrics* metrics) {
  scan_->CollectMetricsInto(metrics);
}

}  // namespace copr
