#ifndef COPR_COPROCESSOR_REQUEST_TASK_H_
#define COPR_COPROCESSOR_REQUEST_TASK_H_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "copr/common/status.h"
#include "copr/coprocessor/analyze_handler.h"
#include "copr/coprocessor/checksum_handler.h"
#include "copr/coprocessor/dag_handler.h"
#include "copr/coprocessor/req_context.h"
#include "copr/coprocessor/request_handler.h"
#include "copr/proto/coprocessor.pb.h"
#include "copr/storage/engine.h"

namespace copr {

using RequestHandler =
    BasicRequestHandler<DagHandler, AnalyzeHandler, ChecksumHandler>;

struct RequestOptions {
  int recursion_limit;
  size_t batch_row_limit;
  size_t stream_batch_row_limit;
  std::chrono::nanoseconds max_handle_duration;
};

/*!
 * \brief A parsed request waiting for a worker. Holds the request context
 *   until the handler is built, which then takes it over.
 */
class RequestTask {
 public:
  using HandlerBuilder = std::function<Status(
      ReqContext, std::shared_ptr<storage::Snapshot>,
      std::unique_ptr<RequestHandler>*)>;

  /*!
   * \brief Parses `req` according to its type code and starts its deadline.
   * \return Other error for unknown types, unparsable payloads, and streaming
   *   requests of a type served only in unary mode.
   */
  static Status Build(const CopRequest& req, std::optional<std::string> peer,
                      bool is_streaming, const RequestOptions& options,
                      std::unique_ptr<RequestTask>* task);

  const ReqContext& req_context() const;
  bool is_streaming() const { return is_streaming_; }
  CommandPri priority() const { return priority_; }

  /*! \brief Builds the handler over `snapshot`. Call at most once. */
  Status BuildHandler(std::shared_ptr<storage::Snapshot> snapshot,
                      std::unique_ptr<RequestHandler>* handler);

 private:
  RequestTask(ReqContext req_ctx, bool is_streaming, HandlerBuilder builder);

  std::optional<ReqContext> req_ctx_;
  bool is_streaming_;
  CommandPri priority_;
  HandlerBuilder builder_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_REQUEST_TASK_H_
