#ifndef COPR_COPROCESSOR_REQUEST_HANDLER_H_
#define COPR_COPROCESSOR_REQUEST_HANDLER_H_

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "copr/common/status.h"
#include "copr/coprocessor/executor_metrics.h"
#include "copr/coprocessor/req_context.h"
#include "copr/proto/coprocessor.pb.h"

namespace copr {

// Analyze and checksum handlers re-check the deadline after this many rows.
// DagHandler checks once per chunk of batch_row_limit rows instead.
constexpr size_t kDeadlineCheckRows = 1024;

/*!
 * \brief Common state of the concrete handlers.
 *
 * A concrete handler declares which modes it serves with two static markers,
 * `kSupportsUnary` and `kSupportsStreaming`, and defines
 *   Status HandleRequest(CopResponse* resp);
 *   Status HandleStreamingRequest(std::optional<CopResponse>* resp,
 *                                 bool* has_more);
 * for the modes it supports. CollectMetricsInto is optional.
 */
class HandlerBase {
 public:
  explicit HandlerBase(ReqContext req_ctx) : req_ctx_(std::move(req_ctx)) {}

  const ReqContext& req_context() const { return req_ctx_; }

  void CollectMetricsInto(ExecutorMetrics* /* metrics */) {}

 protected:
  ReqContext req_ctx_;
};

/*! \brief Aborts the process. Serving a request in a mode its handler lacks
 *   means the dispatch table is broken. */
[[noreturn]] void DieOnUnsupportedMode(const char* mode, const char* tag);

/*!
 * \brief Closed set of request handlers, dispatched by pattern matching on the
 *   variant held.
 */
template <typename... Handlers>
class BasicRequestHandler {
 public:
  template <typename Handler,
            typename = std::enable_if_t<!std::is_same_v<
                std::decay_t<Handler>, BasicRequestHandler>>>
  explicit BasicRequestHandler(Handler&& handler)
      : handler_(std::forward<Handler>(handler)) {}

  /*! \brief Produces the single response of a unary request. */
  Status HandleRequest(CopResponse* resp) {
    return std::visit(
        [resp](auto& handler) -> Status {
          using H = std::decay_t<decltype(handler)>;
          if constexpr (H::kSupportsUnary) {
            return handler.HandleRequest(resp);
          } else {
            DieOnUnsupportedMode("unary", handler.req_context().tag);
          }
        },
        handler_);
  }

  /*!
   * \brief Produces the next chunk of a streaming request.
   * \param resp Left empty when there is nothing more to send.
   * \param has_more Whether another call may produce more chunks.
   */
  Status HandleStreamingRequest(std::optional<CopResponse>* resp,
                                bool* has_more) {
    return std::visit(
        [resp, has_more](auto& handler) -> Status {
          using H = std::decay_t<decltype(handler)>;
          if constexpr (H::kSupportsStreaming) {
            return handler.HandleStreamingRequest(resp, has_more);
          } else {
            DieOnUnsupportedMode("streaming", handler.req_context().tag);
          }
        },
        handler_);
  }

  /*! \brief Merges execution statistics. Call once, after the last step. */
  void CollectMetricsInto(ExecutorMetrics* metrics) {
    std::visit([metrics](auto& handler) { handler.CollectMetricsInto(metrics); },
               handler_);
  }

  bool SupportsUnary() const {
    return std::visit(
        [](const auto& handler) {
          return std::decay_t<decltype(handler)>::kSupportsUnary;
        },
        handler_);
  }

  bool SupportsStreaming() const {
    return std::visit(
        [](const auto& handler) {
          return std::decay_t<decltype(handler)>::kSupportsStreaming;
        },
        handler_);
  }

  const ReqContext& req_context() const {
    return std::visit(
        [](const auto& handler) -> const ReqContext& {
          return handler.req_context();
        },
        handler_);
  }

  template <typename Handler>
  Handler* get_if() {
    return std::get_if<Handler>(&handler_);
  }

 private:
  std::variant<Handlers...> handler_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_REQUEST_HANDLER_H_
