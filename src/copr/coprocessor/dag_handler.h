#ifndef COPR_COPROCESSOR_DAG_HANDLER_H_
#define COPR_COPROCESSOR_DAG_HANDLER_H_

#include <cstddef>
#include <memory>
#include <optional>

#include "copr/coprocessor/dag/executor.h"
#include "copr/coprocessor/request_handler.h"

namespace copr {

/*!
 * \brief Runs a DAG executor chain. Unary requests get every row in one
 *   SelectResponse; streaming requests get one chunk per step.
 */
class DagHandler : public HandlerBase {
 public:
  static constexpr bool kSupportsUnary = true;
  static constexpr bool kSupportsStreaming = true;

  /*!
   * \param batch_row_limit Rows per chunk. Streaming requests send one chunk
   *   per step.
   */
  DagHandler(ReqContext req_ctx, std::unique_ptr<dag::Executor> executor,
             size_t batch_row_limit);

  Status HandleRequest(CopResponse* resp);
  Status HandleStreamingRequest(std::optional<CopResponse>* resp,
                                bool* has_more);
  void CollectMetricsInto(ExecutorMetrics* metrics);

 private:
  std::unique_ptr<dag::Executor> executor_;
  size_t batch_row_limit_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_DAG_HANDLER_H_
