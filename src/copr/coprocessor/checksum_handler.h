#ifndef COPR_COPROCESSOR_CHECKSUM_HANDLER_H_
#define COPR_COPROCESSOR_CHECKSUM_HANDLER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "copr/coprocessor/dag/executor.h"
#include "copr/coprocessor/request_handler.h"
#include "copr/proto/plan.pb.h"

namespace copr {

/*!
 * \brief XOR of the CRC-64 of every visible key and value in the requested
 *   ranges, together with the pair and byte counts.
 */
class ChecksumHandler : public HandlerBase {
 public:
  static constexpr bool kSupportsUnary = true;
  static constexpr bool kSupportsStreaming = false;

  ChecksumHandler(ReqContext req_ctx, ChecksumRequest req,
                  std::unique_ptr<dag::Executor> scan);

  Status HandleRequest(CopResponse* resp);
  void CollectMetricsInto(ExecutorMetrics* metrics);

  /*! \brief CRC-64/XZ of key followed by value. */
  static uint64_t Digest(const std::string& key, const std::string& value);

 private:
  ChecksumRequest req_;
  std::unique_ptr<dag::Executor> scan_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_CHECKSUM_HANDLER_H_
