#ifndef COPR_STORAGE_MEMORY_ENGINE_H_
#define COPR_STORAGE_MEMORY_ENGINE_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "copr/storage/engine.h"

namespace copr {
namespace storage {

/*!
 * \brief Multi-version key-value store kept in memory.
 *
 * Each key holds versions ordered by commit timestamp, newest first. A version
 * without a value is a delete tombstone. Snapshots share the data present at
 * the time they are taken.
 */
class MemoryEngine : public Engine {
 public:
  // commit_ts -> value, newest first
  using Versions =
      std::map<uint64_t, std::optional<std::string>, std::greater<uint64_t>>;
  using Data = std::map<std::string, Versions>;
  using Locks = std::map<std::string, LockInfo>;

  MemoryEngine() = default;
  MemoryEngine(const MemoryEngine& other) = delete;
  MemoryEngine& operator=(const MemoryEngine& other) = delete;

  void AddRegion(uint64_t region_id, uint64_t version);
  void Put(const std::string& key, const std::string& value,
           uint64_t commit_ts);
  void Delete(const std::string& key, uint64_t commit_ts);
  void Lock(const std::string& key, const std::string& primary,
            uint64_t lock_ts, uint64_t ttl);
  void Unlock(const std::string& key);

  Status GetSnapshot(const Context& ctx,
                     std::shared_ptr<Snapshot>* snapshot) override;

 private:
  void Freeze() /* REQUIRES(mutex_) */;

  std::mutex mutex_;
  std::unordered_map<uint64_t, uint64_t> region_versions_ /* GUARDED_BY(mutex_) */;
  Data data_ /* GUARDED_BY(mutex_) */;
  Locks locks_ /* GUARDED_BY(mutex_) */;
  // Immutable copies handed to snapshots. Dropped on every write.
  std::shared_ptr<const Data> frozen_data_ /* GUARDED_BY(mutex_) */;
  std::shared_ptr<const Locks> frozen_locks_ /* GUARDED_BY(mutex_) */;
};

}  // namespace storage
}  // namespace copr

#endif  // COPR_STORAGE_MEMORY_ENGINE_H_
