#ifndef COPR_COPROCESSOR_DAG_EXECUTOR_H_
#define COPR_COPROCESSOR_DAG_EXECUTOR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "copr/common/status.h"
#include "copr/coprocessor/executor_metrics.h"
#include "copr/proto/coprocessor.pb.h"
#include "copr/proto/plan.pb.h"
#include "copr/storage/engine.h"

namespace copr {
namespace dag {

/*! \brief Pull-based row source. */
class Executor {
 public:
  virtual ~Executor() = default;
  /*! \brief Fetches the next row. Leaves `row` empty when drained. */
  virtual Status Next(std::optional<Row>* row) = 0;
  virtual void CollectMetricsInto(ExecutorMetrics* metrics) = 0;
  /*!
   * \brief Key range covered by the rows returned since the previous call.
   * \return false if no row was returned in between.
   */
  virtual bool TakeScannedRange(KeyRange* range) = 0;
};

/*!
 * \brief Reads the visible pairs of a set of ranges at `start_ts`.
 *
 * Ranges must be sorted and disjoint; RequestTask::Build rejects requests
 * that are not. Descending scans visit the ranges in reverse. A range covering exactly one key is served by a point get.
 */
class ScanExecutor : public Executor {
 public:
  ScanExecutor(const char* kind, std::shared_ptr<storage::Snapshot> snapshot,
               std::vector<KeyRange> ranges, uint64_t start_ts, bool desc);

  Status Next(std::optional<Row>* row) override;
  void CollectMetricsInto(ExecutorMetrics* metrics) override;
  bool TakeScannedRange(KeyRange* range) override;

 private:
  const KeyRange& CurrentRange() const;
  void Emit(std::string key, std::string value, std::optional<Row>* row);

  std::shared_ptr<storage::Snapshot> snapshot_;
  std::vector<KeyRange> ranges_;
  uint64_t start_ts_;
  bool desc_;
  size_t range_idx_ = 0;
  std::unique_ptr<storage::Scanner> scanner_;
  ExecutorMetrics metrics_;
  std::optional<std::string> first_key_;
  std::optional<std::string> last_key_;
};

class LimitExecutor : public Executor {
 public:
  LimitExecutor(uint64_t limit, std::unique_ptr<Executor> src);

  Status Next(std::optional<Row>* row) override;
  void CollectMetricsInto(ExecutorMetrics* metrics) override;
  bool TakeScannedRange(KeyRange* range) override;

 private:
  uint64_t limit_;
  uint64_t cursor_ = 0;
  std::unique_ptr<Executor> src_;
};

/*! \brief Whether the first executor of `dag` is an index scan. */
bool IsIndexScan(const DagRequest& dag);

/*! \brief Whether the first executor of `dag` scans in descending order. */
bool IsDescScan(const DagRequest& dag);

/*! \brief Checks the executor chain: one scan followed by limits only. */
Status ValidateExecutors(const DagRequest& dag);

/*! \brief Builds the executor chain of a validated DAG request. */
Status BuildExecutors(const DagRequest& dag,
                      std::shared_ptr<storage::Snapshot> snapshot,
                      std::vector<KeyRange> ranges,
                      std::unique_ptr<Executor>* root);

}  // namespace dag
}  // namespace copr

#endif  // COPR_COPROCESSOR_DAG_EXECUTOR_H_
