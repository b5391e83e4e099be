#ifndef COPR_STORAGE_ENGINE_H_
#define COPR_STORAGE_ENGINE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "copr/common/status.h"
#include "copr/proto/coprocessor.pb.h"
#include "copr/storage/statistics.h"

namespace copr {
namespace storage {

using KvPair = std::pair<std::string, std::string>;

class Scanner {
 public:
  virtual ~Scanner() = default;
  /*!
   * \brief Fetches the next visible pair. Leaves `kv` empty once the range is
   *   exhausted.
   */
  virtual Status Next(std::optional<KvPair>* kv) = 0;
  virtual void CollectStatisticsInto(ScanStatistics* stats) = 0;
};

/*! \brief Consistent read view of one region. */
class Snapshot {
 public:
  virtual ~Snapshot() = default;
  virtual Status Get(const std::string& key, uint64_t ts,
                     std::optional<std::string>* value,
                     ScanStatistics* stats) = 0;
  virtual std::unique_ptr<Scanner> NewScanner(const KeyRange& range,
                                              uint64_t ts, bool desc) = 0;
};

class Engine {
 public:
  virtual ~Engine() = default;
  /*!
   * \brief Opens a snapshot of the region named by `ctx`.
   * \return Region error when the region is unknown or the epoch is stale.
   */
  virtual Status GetSnapshot(const Context& ctx,
                             std::shared_ptr<Snapshot>* snapshot) = 0;
};

}  // namespace storage
}  // namespace copr

#endif  // COPR_STORAGE_ENGINE_H_
