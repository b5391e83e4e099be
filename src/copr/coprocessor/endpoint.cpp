#include "copr/coprocessor/endpoint.h"

#include <glog/logging.h>

#include <utility>
#include <vector>

namespace copr {

namespace {

constexpr const char* kOutdatedErrorMessage =
    "Coprocessor task terminated due to exceeding the deadline";

constexpr const char* kStoppedErrorMessage = "coprocessor host stopped";

}  // namespace

CopResponse ErrorResponse(const Status& status) {
  CHECK(!status.ok()) << "No error to report";
  CopResponse resp;
  switch (status.code()) {
    case Status::kRegion:
      *resp.mutable_region_error() = status.region_error();
      break;
    case Status::kLocked:
      *resp.mutable_locked() = status.lock_info();
      break;
    case Status::kOutdated:
      resp.set_other_error(kOutdatedErrorMessage);
      break;
    case Status::kFull: {
      auto* err = resp.mutable_region_error();
      err->set_message(status.message());
      err->mutable_server_is_busy()->set_reason(status.message());
      break;
    }
    default:
      resp.set_other_error(status.message());
      break;
  }
  return resp;
}

Host::TaskState::TaskState(std::unique_ptr<RequestTask> task,
                           std::shared_ptr<ResponseSink> sink,
                           std::chrono::nanoseconds slow_log_threshold)
    : task(std::move(task)),
      sink(std::move(sink)),
      tracker(this->task->req_context(), slow_log_threshold),
      tag(this->task->req_context().tag),
      context(this->task->req_context().context),
      priority(this->task->priority()) {}

Host::Host(std::shared_ptr<storage::Engine> engine,
           const CoprocessorConfig& config,
           std::shared_ptr<MetricsSink> metrics)
    : engine_(std::move(engine)),
      metrics_(std::move(metrics)),
      slow_log_threshold_(config.slow_log_threshold),
      max_running_task_count_(config.MaxRunningTaskCount()),
      running_task_count_(0),
      read_pool_(config.high_concurrency, config.normal_concurrency,
                 config.low_concurrency) {
  Status s = config.Validate();
  CHECK(s.ok()) << "Invalid coprocessor config: " << s;
  CHECK(engine_ != nullptr);
  CHECK(metrics_ != nullptr);
  options_.recursion_limit = config.recursion_limit;
  options_.batch_row_limit = config.batch_row_limit;
  options_.stream_batch_row_limit = config.stream_batch_row_limit;
  options_.max_handle_duration = config.request_max_handle_duration;
  LOG(INFO) << "Coprocessor host started, max running tasks "
            << max_running_task_count_;
}

Host::~Host() { Stop(); }

void Host::Stop() {
  read_pool_.Stop();
  // Workers have exited. Whatever is still live had its next step discarded.
  std::vector<std::shared_ptr<TaskState>> dropped;
  {
    std::lock_guard<std::mutex> lock(live_tasks_mutex_);
    for (const auto& entry : live_tasks_) {
      dropped.push_back(entry.second);
    }
  }
  if (!dropped.empty()) {
    LOG(WARNING) << "Coprocessor host stopped with " << dropped.size()
                 << " requests in flight";
  }
  for (auto& state : dropped) {
    Fail(std::move(state), Status::Other(kStoppedErrorMessage));
  }
}

void Host::HandleRequest(const CopRequest& req,
                         std::optional<std::string> peer,
                         std::shared_ptr<ResponseSink> sink) {
  Submit(req, std::move(peer), false, std::move(sink));
}

void Host::HandleStreamRequest(const CopRequest& req,
                               std::optional<std::string> peer,
                               std::shared_ptr<ResponseSink> sink) {
  Submit(req, std::move(peer), true, std::move(sink));
}

void Host::Submit(const CopRequest& req, std::optional<std::string> peer,
                  bool is_streaming, std::shared_ptr<ResponseSink> sink) {
  std::unique_ptr<RequestTask> task;
  Status s = RequestTask::Build(req, std::move(peer), is_streaming, options_,
                                &task);
  if (!s.ok()) {
    LOG(WARNING) << "Bad coprocessor request of tp " << req.tp()
                 << " for region " << req.context().region_id() << ": " << s;
    Reject("unknown", s, sink.get());
    return;
  }
  const char* tag = task->req_context().tag;
  if (running_task_count_.fetch_add(1) >= max_running_task_count_) {
    running_task_count_.fetch_sub(1);
    Reject(tag, Status::Full(), sink.get());
    return;
  }
  VLOG(1) << "Accepted " << (is_streaming ? "streaming " : "") << tag
          << " request for region " << req.context().region_id() << ", "
          << req.ranges_size() << " ranges";

  auto state = std::make_shared<TaskState>(std::move(task), std::move(sink),
                                           slow_log_threshold_);
  {
    std::lock_guard<std::mutex> lock(live_tasks_mutex_);
    live_tasks_.emplace(state.get(), state);
  }
  Schedule(state, [this, state] { RunTask(state); });
}

void Host::Schedule(std::shared_ptr<TaskState> state, ReadPool::Task step) {
  if (!read_pool_.Post(state->priority, std::move(step))) {
    Fail(std::move(state), Status::Other(kStoppedErrorMessage));
  }
}

bool Host::Release(TaskState* state) {
  std::lock_guard<std::mutex> lock(live_tasks_mutex_);
  return live_tasks_.erase(state) > 0;
}

void Host::Reject(const char* tag, const Status& status, ResponseSink* sink) {
  metrics_->ReportError(tag, status.KindName());
  sink->Send(ErrorResponse(status));
  sink->Close();
}

void Host::RunTask(std::shared_ptr<TaskState> state) {
  state->tracker.OnStepBegin();
  // Reject overdue requests before any storage work.
  Status s = state->task->req_context().deadline.CheckIfExceeded();
  std::shared_ptr<storage::Snapshot> snapshot;
  if (s.ok()) {
    s = engine_->GetSnapshot(state->context, &snapshot);
  }
  if (s.ok()) {
    s = state->task->BuildHandler(std::move(snapshot), &state->handler);
  }
  if (!s.ok()) {
    Fail(std::move(state), s);
    return;
  }
  if (state->task->is_streaming()) {
    RunStreamStep(std::move(state));
  } else {
    RunUnary(std::move(state));
  }
}

void Host::RunUnary(std::shared_ptr<TaskState> state) {
  CopResponse resp;
  Status s = state->handler->HandleRequest(&resp);
  if (!s.ok()) {
    Fail(std::move(state), s);
    return;
  }
  Finish(std::move(state), std::move(resp), true);
}

void Host::RunStreamStep(std::shared_ptr<TaskState> state) {
  std::optional<CopResponse> resp;
  bool has_more = false;
  Status s = state->handler->HandleStreamingRequest(&resp, &has_more);
  if (!s.ok()) {
    Fail(std::move(state), s);
    return;
  }
  if (!resp.has_value()) {
    Finish(std::move(state), std::nullopt, false);
    return;
  }
  state->sink->Send(std::move(*resp));
  if (!has_more) {
    Finish(std::move(state), std::nullopt, false);
    return;
  }
  // Yield the worker between chunks.
  state->tracker.OnStepEnd();
  Schedule(state, [this, state] {
    state->tracker.OnStepBegin();
    RunStreamStep(state);
  });
}

void Host::Fail(std::shared_ptr<TaskState> state, const Status& status) {
  if (!Release(state.get())) {
    return;
  }
  if (status.code() == Status::kOther) {
    LOG(WARNING) << "Coprocessor " << state->tag << " request for region "
                 << state->context.region_id() << " failed: " << status;
  } else {
    VLOG(1) << "Coprocessor " << state->tag << " request for region "
            << state->context.region_id() << " failed: " << status;
  }
  metrics_->ReportError(state->tag, status.KindName());
  Complete(state.get(), ErrorResponse(status), false);
}

void Host::Finish(std::shared_ptr<TaskState> state,
                  std::optional<CopResponse> last, bool with_exec_details) {
  if (!Release(state.get())) {
    return;
  }
  Complete(state.get(), std::move(last), with_exec_details);
}

void Host::Complete(TaskState* state, std::optional<CopResponse> last,
                    bool with_exec_details) {
  if (state->handler != nullptr) {
    state->handler->CollectMetricsInto(state->tracker.mutable_exec_metrics());
  }
  state->tracker.OnFinish(metrics_.get());
  if (last.has_value()) {
    const Context& ctx = state->context;
    if (with_exec_details && (ctx.handle_time() || ctx.scan_detail())) {
      state->tracker.FillExecDetails(ctx, last->mutable_exec_details());
    }
    state->sink->Send(std::move(*last));
  }
  running_task_count_.fetch_sub(1);
  state->sink->Close();
}

}  // namespace copr
