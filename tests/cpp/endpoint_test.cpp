#include "copr/coprocessor/endpoint.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "copr/common/util.h"
#include "copr/coprocessor/metrics.h"
#include "test_util.h"

using namespace copr;
using namespace copr::test;
using namespace std::chrono_literals;

namespace {

CoprocessorConfig TestConfig() {
  CoprocessorConfig config;
  config.high_concurrency = 1;
  config.normal_concurrency = 2;
  config.low_concurrency = 1;
  config.stream_batch_row_limit = 4;
  config.request_max_handle_duration = 1h;
  config.slow_log_threshold = 1h;
  return config;
}

}  // namespace

class EndpointTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = MakeEngine(12);
    metrics_ = std::make_shared<CopMetrics>();
  }

  void StartHost(const CoprocessorConfig& config) {
    host_ = std::make_unique<Host>(engine_, config, metrics_);
  }

  std::shared_ptr<CollectingSink> Unary(const CopRequest& req) {
    auto sink = std::make_shared<CollectingSink>();
    host_->HandleRequest(req, std::string("test-peer"), sink);
    EXPECT_TRUE(sink->WaitClosed());
    return sink;
  }

  std::shared_ptr<CollectingSink> Streaming(const CopRequest& req) {
    auto sink = std::make_shared<CollectingSink>();
    host_->HandleStreamRequest(req, std::string("test-peer"), sink);
    EXPECT_TRUE(sink->WaitClosed());
    return sink;
  }

  std::shared_ptr<storage::MemoryEngine> engine_;
  std::shared_ptr<CopMetrics> metrics_;
  std::unique_ptr<Host> host_;
};

TEST_F(EndpointTest, UnaryDag) {
  StartHost(TestConfig());
  auto sink = Unary(MakeDagRequest({MakeRange(RowKey(2), RowKey(9))}, false,
                                   std::nullopt));
  auto responses = sink->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ(1, sink->close_count());
  EXPECT_TRUE(responses[0].other_error().empty());
  EXPECT_FALSE(responses[0].has_region_error());
  EXPECT_EQ(7u, SelectedKeys(responses[0]).size());
  EXPECT_FALSE(responses[0].has_exec_details());

  auto stats = metrics_->Get("select");
  EXPECT_EQ(1, stats.requests);
  EXPECT_EQ(7, stats.exec.cf_stats.processed);
  EXPECT_EQ(1, stats.exec.scan_counter.range);
  EXPECT_EQ(1, stats.exec.executor_count.at("tblscan"));
  EXPECT_TRUE(stats.errors.empty());
  EXPECT_EQ(0u, host_->running_task_count());
}

TEST_F(EndpointTest, StreamingExactMultipleOfBatch) {
  StartHost(TestConfig());
  auto sink = Streaming(
      MakeDagRequest({MakeRange(RowKey(0), RowKey(12))}, false, std::nullopt));
  auto responses = sink->responses();
  ASSERT_EQ(3u, responses.size());
  EXPECT_EQ(1, sink->close_count());

  std::vector<std::string> keys;
  for (const auto& resp : responses) {
    EXPECT_EQ(1u, ChunkCount(resp));
    auto chunk_keys = SelectedKeys(resp);
    EXPECT_EQ(4u, chunk_keys.size());
    EXPECT_EQ(chunk_keys.front(), resp.range().start());
    EXPECT_EQ(NextKey(chunk_keys.back()), resp.range().end());
    keys.insert(keys.end(), chunk_keys.begin(), chunk_keys.end());
  }
  ASSERT_EQ(12u, keys.size());
  for (int i = 0; i < 12; ++i) {
    EXPECT_EQ(RowKey(i), keys[i]);
  }

  // Statistics are merged once, after the last step.
  auto stats = metrics_->Get("select");
  EXPECT_EQ(1, stats.requests);
  EXPECT_EQ(12, stats.exec.cf_stats.processed);
  EXPECT_EQ(12, stats.exec.cf_stats.total);
  EXPECT_EQ(1, stats.exec.scan_counter.range);
  EXPECT_EQ(1, stats.exec.executor_count.at("tblscan"));
}

TEST_F(EndpointTest, StreamingMatchesUnary) {
  StartHost(TestConfig());
  auto req = MakeDagRequest({MakeRange(RowKey(0), RowKey(5)),
                             MakeRange(RowKey(7), NextKey(RowKey(7))),
                             MakeRange(RowKey(9), "")},
                            true, 6);
  auto unary = Unary(req)->responses();
  ASSERT_EQ(1u, unary.size());

  auto streamed = Streaming(req)->responses();
  ASSERT_EQ(2u, streamed.size());
  std::vector<std::string> keys;
  for (const auto& resp : streamed) {
    auto chunk_keys = SelectedKeys(resp);
    keys.insert(keys.end(), chunk_keys.begin(), chunk_keys.end());
  }
  EXPECT_EQ(SelectedKeys(unary[0]), keys);
  std::vector<std::string> expected = {RowKey(11), RowKey(10), RowKey(9),
                                       RowKey(7),  RowKey(4),  RowKey(3)};
  EXPECT_EQ(expected, keys);
}

TEST_F(EndpointTest, EmptyStream) {
  StartHost(TestConfig());
  auto sink = Streaming(MakeDagRequest({MakeRange("x", "y")}, false,
                                       std::nullopt));
  EXPECT_TRUE(sink->responses().empty());
  EXPECT_EQ(1, sink->close_count());
  EXPECT_EQ(1, metrics_->Get("select").requests);
}

TEST_F(EndpointTest, ExecDetails) {
  StartHost(TestConfig());
  auto req = MakeDagRequest({MakeRange("", "")}, false, std::nullopt);
  req.mutable_context()->set_handle_time(true);
  req.mutable_context()->set_scan_detail(true);
  auto responses = Unary(req)->responses();
  ASSERT_EQ(1u, responses.size());
  const auto& details = responses[0].exec_details();
  EXPECT_TRUE(details.has_handle_time());
  EXPECT_GE(details.handle_time().wait_ms(), 0);
  EXPECT_GE(details.handle_time().process_ms(), 0);
  ASSERT_TRUE(details.has_scan_detail());
  EXPECT_EQ(12, details.scan_detail().processed());
  EXPECT_EQ(12, details.scan_detail().total());

  req.mutable_context()->set_handle_time(false);
  responses = Unary(req)->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_FALSE(responses[0].exec_details().has_handle_time());
  EXPECT_TRUE(responses[0].exec_details().has_scan_detail());
}

TEST_F(EndpointTest, AnalyzeAndChecksum) {
  StartHost(TestConfig());
  auto analyze = Unary(MakeAnalyzeRequest({MakeRange("", "")},
                                          AnalyzeType::TypeColumn, 4))
                     ->responses();
  ASSERT_EQ(1u, analyze.size());
  AnalyzeResp analyze_resp;
  ASSERT_TRUE(analyze_resp.ParseFromString(analyze[0].data()));
  EXPECT_EQ(12u, analyze_resp.total_count());
  EXPECT_EQ(4, analyze_resp.hist().buckets_size());

  auto checksum =
      Unary(MakeChecksumRequest({MakeRange(RowKey(0), RowKey(3))}))
          ->responses();
  ASSERT_EQ(1u, checksum.size());
  ChecksumResponse checksum_resp;
  ASSERT_TRUE(checksum_resp.ParseFromString(checksum[0].data()));
  EXPECT_EQ(3u, checksum_resp.total_kvs());

  EXPECT_EQ(1, metrics_->Get("analyze_table").requests);
  EXPECT_EQ(1, metrics_->Get("checksum_table").requests);
  EXPECT_EQ(12, metrics_->Get("analyze_table").exec.cf_stats.processed);
}

TEST_F(EndpointTest, StreamingAnalyzeRejected) {
  StartHost(TestConfig());
  auto sink = Streaming(
      MakeAnalyzeRequest({MakeRange("", "")}, AnalyzeType::TypeIndex, 4));
  auto responses = sink->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ("streaming analyze request is not supported",
            responses[0].other_error());
  EXPECT_EQ(1, sink->close_count());
  EXPECT_EQ(1, metrics_->Get("unknown").errors["other"]);
}

TEST_F(EndpointTest, UnknownRequestType) {
  StartHost(TestConfig());
  auto req = MakeDagRequest({}, false, std::nullopt);
  req.set_tp(999);
  auto responses = Unary(req)->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ("unsupported tp 999", responses[0].other_error());
}

TEST_F(EndpointTest, RegionErrors) {
  StartHost(TestConfig());
  auto req = MakeDagRequest({MakeRange("", "")}, false, std::nullopt);
  req.mutable_context()->set_region_id(kRegionId + 100);
  auto responses = Unary(req)->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_TRUE(responses[0].region_error().has_region_not_found());
  EXPECT_TRUE(responses[0].data().empty());

  req = MakeDagRequest({MakeRange("", "")}, false, std::nullopt);
  req.mutable_context()->mutable_region_epoch()->set_version(kRegionVersion +
                                                            1);
  responses = Streaming(req)->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_TRUE(responses[0].region_error().has_epoch_not_match());

  auto stats = metrics_->Get("select");
  EXPECT_EQ(2, stats.errors["region"]);
  EXPECT_EQ(2, stats.requests);
}

TEST_F(EndpointTest, LockedKey) {
  engine_->Lock(RowKey(4), RowKey(4), kReadTs - 1, 10);
  StartHost(TestConfig());
  auto responses = Streaming(MakeDagRequest({MakeRange("", "")}, false,
                                            std::nullopt))
                       ->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_TRUE(responses[0].has_locked());
  EXPECT_EQ(RowKey(4), responses[0].locked().key());
  EXPECT_EQ(1, metrics_->Get("select").errors["lock"]);
}

TEST_F(EndpointTest, DeadlineExceeded) {
  auto config = TestConfig();
  config.normal_concurrency = 1;
  config.request_max_handle_duration = 1ms;
  config.slow_log_threshold = 0ms;
  StartHost(config);
  // Occupy the only normal worker so the next requests wait past their
  // deadline in the queue.
  auto blocker = std::make_shared<GatedSink>();
  host_->HandleRequest(
      MakeAnalyzeRequest({MakeRange("", "")}, AnalyzeType::TypeColumn, 4),
      std::nullopt, blocker);
  auto checksum = std::make_shared<CollectingSink>();
  host_->HandleRequest(MakeChecksumRequest({MakeRange("", "")}), std::nullopt,
                       checksum);
  auto stream = std::make_shared<CollectingSink>();
  host_->HandleStreamRequest(
      MakeDagRequest({MakeRange("", "")}, false, std::nullopt), std::nullopt,
      stream);
  std::this_thread::sleep_for(30ms);
  blocker->Open();
  ASSERT_TRUE(blocker->WaitClosed());
  ASSERT_TRUE(checksum->WaitClosed());
  ASSERT_TRUE(stream->WaitClosed());

  auto responses = checksum->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ("Coprocessor task terminated due to exceeding the deadline",
            responses[0].other_error());
  EXPECT_TRUE(responses[0].data().empty());

  responses = stream->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ("Coprocessor task terminated due to exceeding the deadline",
            responses[0].other_error());

  EXPECT_EQ(1, metrics_->Get("checksum_table").errors["outdated"]);
  EXPECT_EQ(1, metrics_->Get("select").errors["outdated"]);
  EXPECT_EQ(0u, host_->running_task_count());
}

TEST_F(EndpointTest, RunningTaskLimit) {
  auto config = TestConfig();
  config.normal_concurrency = 1;
  config.max_tasks_per_worker = 1;
  StartHost(config);
  ASSERT_EQ(3u, host_->max_running_task_count());

  // Accepted requests stay running while their sinks hold the response.
  std::vector<std::shared_ptr<GatedSink>> held;
  for (int i = 0; i < 3; ++i) {
    held.push_back(std::make_shared<GatedSink>());
    host_->HandleRequest(
        MakeDagRequest({MakeRange("", "")}, false, std::nullopt),
        std::nullopt, held.back());
  }
  EXPECT_EQ(3u, host_->running_task_count());

  auto rejected = std::make_shared<CollectingSink>();
  host_->HandleRequest(MakeDagRequest({MakeRange("", "")}, false, std::nullopt),
                       std::nullopt, rejected);
  // Rejection happens on the submitting thread.
  EXPECT_EQ(1, rejected->close_count());
  for (auto& sink : held) {
    sink->Open();
  }
  for (auto& sink : held) {
    ASSERT_TRUE(sink->WaitClosed());
    ASSERT_EQ(1u, sink->responses().size());
    EXPECT_EQ(12u, SelectedKeys(sink->responses()[0]).size());
  }

  auto responses = rejected->responses();
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ("running batches reach limit",
            responses[0].region_error().server_is_busy().reason());
  EXPECT_EQ(1, metrics_->Get("select").errors["full"]);
  EXPECT_EQ(3, metrics_->Get("select").requests);
  EXPECT_EQ(0u, host_->running_task_count());
}

TEST_F(EndpointTest, StreamingErrorAfterPartialData) {
  engine_->Lock(RowKey(11), RowKey(11), kReadTs - 1, 10);
  StartHost(TestConfig());
  auto sink = Streaming(
      MakeDagRequest({MakeRange(RowKey(0), RowKey(8)),
                      MakeRange(RowKey(11), NextKey(RowKey(11)))},
                     false, std::nullopt));
  auto responses = sink->responses();
  ASSERT_EQ(3u, responses.size());
  EXPECT_EQ(1, sink->close_count());
  for (int i = 0; i < 2; ++i) {
    auto keys = SelectedKeys(responses[i]);
    ASSERT_EQ(4u, keys.size());
    EXPECT_EQ(RowKey(4 * i), keys.front());
    EXPECT_EQ(RowKey(4 * i + 3), keys.back());
    EXPECT_FALSE(responses[i].has_locked());
  }
  ASSERT_TRUE(responses[2].has_locked());
  EXPECT_EQ(RowKey(11), responses[2].locked().key());
  EXPECT_TRUE(responses[2].data().empty());

  // Statistics of the rows already streamed are merged once with the error.
  auto stats = metrics_->Get("select");
  EXPECT_EQ(1, stats.requests);
  EXPECT_EQ(8, stats.exec.cf_stats.processed);
  EXPECT_EQ(1, stats.exec.executor_count.at("tblscan"));
  EXPECT_EQ(1, stats.errors["lock"]);
  EXPECT_EQ(0u, host_->running_task_count());
}

TEST_F(EndpointTest, StopEndsRunningStream) {
  auto config = TestConfig();
  config.stream_batch_row_limit = 1;
  StartHost(config);
  auto sink = std::make_shared<SlowSink>(20ms);
  host_->HandleStreamRequest(
      MakeDagRequest({MakeRange("", "")}, false, std::nullopt), std::nullopt,
      sink);
  ASSERT_TRUE(sink->WaitResponses(1));
  host_->Stop();

  // The stream is closed with an error before Stop returns.
  EXPECT_EQ(1, sink->close_count());
  auto responses = sink->responses();
  ASSERT_GE(responses.size(), 2u);
  ASSERT_LT(responses.size(), 13u);
  for (size_t i = 0; i + 1 < responses.size(); ++i) {
    auto keys = SelectedKeys(responses[i]);
    ASSERT_EQ(1u, keys.size());
    EXPECT_EQ(RowKey(static_cast<int>(i)), keys[0]);
  }
  EXPECT_EQ("coprocessor host stopped", responses.back().other_error());
  EXPECT_EQ(0u, host_->running_task_count());

  // Requests arriving after Stop are answered at once.
  auto late = std::make_shared<CollectingSink>();
  host_->HandleRequest(MakeDagRequest({MakeRange("", "")}, false, std::nullopt),
                       std::nullopt, late);
  EXPECT_EQ(1, late->close_count());
  ASSERT_EQ(1u, late->responses().size());
  EXPECT_EQ("coprocessor host stopped", late->responses()[0].other_error());

  auto stats = metrics_->Get("select");
  EXPECT_EQ(2, stats.requests);
  EXPECT_EQ(2, stats.errors["other"]);
  EXPECT_EQ(0u, host_->running_task_count());
}

TEST_F(EndpointTest, ConcurrentRequests) {
  StartHost(TestConfig());
  constexpr int kThreads = 4;
  constexpr int kRequestsPerThread = 25;
  std::vector<std::shared_ptr<CollectingSink>> sinks(kThreads *
                                                     kRequestsPerThread);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t, &sinks] {
      for (int i = 0; i < kRequestsPerThread; ++i) {
        auto req = MakeDagRequest({MakeRange("", "")}, false, std::nullopt);
        req.mutable_context()->set_priority(
            static_cast<CommandPri>(i % 3));
        auto sink = std::make_shared<CollectingSink>();
        sinks[t * kRequestsPerThread + i] = sink;
        if (i % 2 == 0) {
          host_->HandleRequest(req, std::nullopt, sink);
        } else {
          host_->HandleStreamRequest(req, std::nullopt, sink);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (size_t i = 0; i < sinks.size(); ++i) {
    ASSERT_TRUE(sinks[i]->WaitClosed());
    size_t rows = 0;
    for (const auto& resp : sinks[i]->responses()) {
      rows += SelectedKeys(resp).size();
    }
    EXPECT_EQ(12u, rows) << "request " << i;
  }
  EXPECT_EQ(0u, host_->running_task_count());
  auto stats = metrics_->Get("select");
  EXPECT_EQ(kThreads * kRequestsPerThread, stats.requests);
  EXPECT_EQ(12 * kThreads * kRequestsPerThread, stats.exec.cf_stats.processed);
}

TEST(EndpointDeathTest, RejectsInvalidConfig) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  auto config = TestConfig();
  config.batch_row_limit = 0;
  EXPECT_DEATH(
      { Host host(MakeEngine(1), config, std::make_shared<CopMetrics>()); },
      "Invalid coprocessor config");

  config = TestConfig();
  config.low_concurrency = 0;
  EXPECT_DEATH(
      { Host host(MakeEngine(1), config, std::make_shared<CopMetrics>()); },
      "read pool concurrency must be positive");
}

TEST(ErrorResponseTest, MapsEveryKind) {
  RegionError region;
  region.set_message("not leader");
  region.mutable_not_leader()->set_region_id(3);
  auto resp = ErrorResponse(Status::Region(region));
  EXPECT_EQ(3u, resp.region_error().not_leader().region_id());
  EXPECT_TRUE(resp.other_error().empty());

  LockInfo lock;
  lock.set_key("k");
  resp = ErrorResponse(Status::Locked(lock));
  EXPECT_EQ("k", resp.locked().key());

  resp = ErrorResponse(Status::Outdated(5s, "select"));
  EXPECT_EQ("Coprocessor task terminated due to exceeding the deadline",
            resp.other_error());

  resp = ErrorResponse(Status::Full());
  EXPECT_EQ("running batches reach limit",
            resp.region_error().server_is_busy().reason());
  EXPECT_EQ("running batches reach limit", resp.region_error().message());

  resp = ErrorResponse(Status::Other("boom"));
  EXPECT_EQ("boom", resp.other_error());
  EXPECT_FALSE(resp.has_region_error());
  EXPECT_FALSE(resp.has_locked());
}
