#ifndef COPR_COPROCESSOR_ENDPOINT_H_
#define COPR_COPROCESSOR_ENDPOINT_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "copr/common/status.h"
#include "copr/coprocessor/config.h"
#include "copr/coprocessor/metrics.h"
#include "copr/coprocessor/read_pool.h"
#include "copr/coprocessor/request_task.h"
#include "copr/coprocessor/tracker.h"
#include "copr/proto/coprocessor.pb.h"
#include "copr/storage/engine.h"

namespace copr {

/*!
 * \brief Destination of the responses of one request. A unary request gets
 *   one Send, a streaming request one Send per chunk; both end with Close.
 *   Calls for one request never overlap.
 */
class ResponseSink {
 public:
  virtual ~ResponseSink() = default;
  virtual void Send(CopResponse resp) = 0;
  virtual void Close() = 0;
};

/*! \brief Converts a failed status into the response reported to clients. */
CopResponse ErrorResponse(const Status& status);

/*!
 * \brief Coprocessor endpoint. Builds a handler for each request and drives
 *   it on the read pool until it reaches a terminal state.
 */
class Host {
 public:
  Host(std::shared_ptr<storage::Engine> engine,
       const CoprocessorConfig& config, std::shared_ptr<MetricsSink> metrics);
  Host(const Host& other) = delete;
  Host& operator=(const Host& other) = delete;
  ~Host();

  void HandleRequest(const CopRequest& req, std::optional<std::string> peer,
                     std::shared_ptr<ResponseSink> sink);
  void HandleStreamRequest(const CopRequest& req,
                           std::optional<std::string> peer,
                           std::shared_ptr<ResponseSink> sink);

  /*!
   * \brief Stops the read pool. Requests still in flight, and requests
   *   submitted afterwards, end with an error response and a closed sink.
   */
  void Stop();

  size_t running_task_count() const { return running_task_count_.load(); }
  size_t max_running_task_count() const { return max_running_task_count_; }

 private:
  struct TaskState {
    TaskState(std::unique_ptr<RequestTask> task,
              std::shared_ptr<ResponseSink> sink,
              std::chrono::nanoseconds slow_log_threshold);

    std::unique_ptr<RequestTask> task;
    std::unique_ptr<RequestHandler> handler;
    std::shared_ptr<ResponseSink> sink;
    Tracker tracker;
    const char* tag;
    Context context;
    CommandPri priority;
  };

  void Submit(const CopRequest& req, std::optional<std::string> peer,
              bool is_streaming, std::shared_ptr<ResponseSink> sink);
  void Reject(const char* tag, const Status& status, ResponseSink* sink);
  void RunTask(std::shared_ptr<TaskState> state);
  void RunUnary(std::shared_ptr<TaskState> state);
  void RunStreamStep(std::shared_ptr<TaskState> state);
  /*! \brief Queues the next step of `state`, failing the task if the pool
   *   has stopped. */
  void Schedule(std::shared_ptr<TaskState> state, ReadPool::Task step);
  /*! \brief Removes `state` from the live tasks. Only the caller that gets
   *   true may finish the task. */
  bool Release(TaskState* state);
  void Fail(std::shared_ptr<TaskState> state, const Status& status);
  void Finish(std::shared_ptr<TaskState> state,
              std::optional<CopResponse> last, bool with_exec_details);
  void Complete(TaskState* state, std::optional<CopResponse> last,
                bool with_exec_details);

  std::shared_ptr<storage::Engine> engine_;
  std::shared_ptr<MetricsSink> metrics_;
  RequestOptions options_;
  std::chrono::nanoseconds slow_log_threshold_;
  size_t max_running_task_count_;
  std::atomic<size_t> running_task_count_;
  std::mutex live_tasks_mutex_;
  std::unordered_map<TaskState*, std::shared_ptr<TaskState>> live_tasks_
      /* GUARDED_BY(live_tasks_mutex_) */;
  ReadPool read_pool_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_ENDPOINT_H_
