#ifndef COPR_COPROCESSOR_ANALYZE_HANDLER_H_
#define COPR_COPROCESSOR_ANALYZE_HANDLER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "copr/coprocessor/dag/executor.h"
#include "copr/coprocessor/request_handler.h"
#include "copr/proto/plan.pb.h"

namespace copr {

/*!
 * \brief Collects statistics over the requested ranges: an equal-depth
 *   histogram and the number of distinct values, over index keys or row
 *   values.
 */
class AnalyzeHandler : public HandlerBase {
 public:
  static constexpr bool kSupportsUnary = true;
  static constexpr bool kSupportsStreaming = false;

  static constexpr uint32_t kDefaultBucketSize = 256;

  AnalyzeHandler(ReqContext req_ctx, AnalyzeReq req,
                 std::unique_ptr<dag::Executor> scan);

  Status HandleRequest(CopResponse* resp);
  void CollectMetricsInto(ExecutorMetrics* metrics);

  /*!
   * \brief Builds an equal-depth histogram over sorted `values`. Equal values
   *   never straddle two buckets.
   */
  static void BuildHistogram(const std::vector<std::string>& values,
                             uint32_t bucket_size, Histogram* hist);

 private:
  AnalyzeReq req_;
  std::unique_ptr<dag::Executor> scan_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_ANALYZE_HANDLER_H_
