#include "copr/storage/memory_engine.h"

#include <glog/logging.h>

#include <utility>

namespace copr {
namespace storage {

namespace {

using Data = MemoryEngine::Data;
using Locks = MemoryEngine::Locks;
using Versions = MemoryEngine::Versions;

Status CheckLock(const Locks& locks, const std::string& key, uint64_t ts) {
  auto iter = locks.find(key);
  if (iter != locks.end() && iter->second.lock_version() <= ts) {
    return Status::Locked(iter->second);
  }
  return Status::OK();
}

// Newest version committed at or before `ts`. Empty for tombstones and for
// keys written only after `ts`.
std::optional<std::string> ReadVersion(const Versions& versions, uint64_t ts,
                                       ScanStatistics* stats) {
  for (const auto& [commit_ts, value] : versions) {
    ++stats->total;
    if (commit_ts <= ts) {
      return value;
    }
  }
  return std::nullopt;
}

bool InRange(const KeyRange& range, const std::string& key) {
  return key >= range.start() && (range.end().empty() || key < range.end());
}

class MemoryScanner : public Scanner {
 public:
  MemoryScanner(std::shared_ptr<const Data> data,
                std::shared_ptr<const Locks> locks, KeyRange range,
                uint64_t ts, bool desc)
      : data_(std::move(data)),
        locks_(std::move(locks)),
        range_(std::move(range)),
        ts_(ts),
        desc_(desc) {
    if (desc_) {
      next_ = range_.end().empty() ? data_->end()
                                   : data_->lower_bound(range_.end());
    } else {
      next_ = data_->lower_bound(range_.start());
    }
  }

  Status Next(std::optional<KvPair>* kv) override {
    kv->reset();
    if (!lock_checked_) {
      lock_checked_ = true;
      for (auto iter = locks_->lower_bound(range_.start());
           iter != locks_->end() && InRange(range_, iter->first); ++iter) {
        if (iter->second.lock_version() <= ts_) {
          return Status::Locked(iter->second);
        }
      }
    }
    while (!exhausted_) {
      Data::const_iterator iter;
      if (desc_) {
        if (next_ == data_->begin()) {
          exhausted_ = true;
          break;
        }
        iter = --next_;
        if (iter->first < range_.start()) {
          exhausted_ = true;
          break;
        }
      } else {
        if (next_ == data_->end() || !InRange(range_, next_->first)) {
          exhausted_ = true;
          break;
        }
        iter = next_++;
      }
      auto value = ReadVersion(iter->second, ts_, &stats_);
      if (value.has_value()) {
        ++stats_.processed;
        kv->emplace(iter->first, std::move(*value));
        return Status::OK();
      }
    }
    return Status::OK();
  }

  void CollectStatisticsInto(ScanStatistics* stats) override {
    stats->Add(stats_);
    stats_ = ScanStatistics();
  }

 private:
  std::shared_ptr<const Data> data_;
  std::shared_ptr<const Locks> locks_;
  KeyRange range_;
  uint64_t ts_;
  bool desc_;
  bool lock_checked_ = false;
  bool exhausted_ = false;
  Data::const_iterator next_;
  ScanStatistics stats_;
};

class MemorySnapshot : public Snapshot {
 public:
  MemorySnapshot(std::shared_ptr<const Data> data,
                 std::shared_ptr<const Locks> locks)
      : data_(std::move(data)), locks_(std::move(locks)) {}

  Status Get(const std::string& key, uint64_t ts,
             std::optional<std::string>* value,
             ScanStatistics* stats) override {
    value->reset();
    COPR_RETURN_IF_ERROR(CheckLock(*locks_, key, ts));
    auto iter = data_->find(key);
    if (iter == data_->end()) {
      return Status::OK();
    }
    *value = ReadVersion(iter->second, ts, stats);
    if (value->has_value()) {
      ++stats->processed;
    }
    return Status::OK();
  }

  std::unique_ptr<Scanner> NewScanner(const KeyRange& range, uint64_t ts,
                                      bool desc) override {
    return std::make_unique<MemoryScanner>(data_, locks_, range, ts, desc);
  }

 private:
  std::shared_ptr<const Data> data_;
  std::shared_ptr<const Locks> locks_;
};

}  // namespace

void MemoryEngine::AddRegion(uint64_t region_id, uint64_t version) {
  std::lock_guard<std::mutex> lock(mutex_);
  region_versions_[region_id] = version;
}

void MemoryEngine::Put(const std::string& key, const std::string& value,
                       uint64_t commit_ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_[key][commit_ts] = value;
  frozen_data_.reset();
}

void MemoryEngine::Delete(const std::string& key, uint64_t commit_ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_[key][commit_ts] = std::nullopt;
  frozen_data_.reset();
}

void MemoryEngine::Lock(const std::string& key, const std::string& primary,
                        uint64_t lock_ts, uint64_t ttl) {
  LockInfo info;
  info.set_key(key);
  info.set_primary_lock(primary);
  info.set_lock_version(lock_ts);
  info.set_lock_ttl(ttl);
  std::lock_guard<std::mutex> lock(mutex_);
  locks_[key] = std::move(info);
  frozen_locks_.reset();
}

void MemoryEngine::Unlock(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  locks_.erase(key);
  frozen_locks_.reset();
}

void MemoryEngine::Freeze() {
  if (frozen_data_ == nullptr) {
    frozen_data_ = std::make_shared<const Data>(data_);
  }
  if (frozen_locks_ == nullptr) {
    frozen_locks_ = std::make_shared<const Locks>(locks_);
  }
}

Status MemoryEngine::GetSnapshot(const Context& ctx,
                                 std::shared_ptr<Snapshot>* snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = region_versions_.find(ctx.region_id());
  if (iter == region_versions_.end()) {
    RegionError err;
    err.set_message("region " + std::to_string(ctx.region_id()) +
                    " not found");
    err.mutable_region_not_found()->set_region_id(ctx.region_id());
    return Status::Region(std::move(err));
  }
  if (ctx.region_epoch().version() != iter->second) {
    RegionError err;
    err.set_message("epoch not match, request version " +
                    std::to_string(ctx.region_epoch().version()) +
                    ", current version " + std::to_string(iter->second));
    err.mutable_epoch_not_match()->mutable_current_epoch()->set_version(
        iter->second);
    return Status::Region(std::move(err));
  }
  Freeze();
  VLOG(2) << "Snapshot of region " << ctx.region_id() << " with "
          << frozen_data_->size() << " keys";
  *snapshot = std::make_shared<MemorySnapshot>(frozen_data_, frozen_locks_);
  return Status::OK();
}

}  // namespace storage
}  // namespace copr
