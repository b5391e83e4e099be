#include "copr/common/status.h"

#include <sstream>
#include <utility>

#include "copr/common/time_util.h"

namespace copr {

Status::Status(Code code, std::string message)
    : code_(code), message_(std::move(message)) {}

Status Status::Region(RegionError error) {
  Status s(kRegion, error.message());
  s.region_error_ = std::make_shared<const RegionError>(std::move(error));
  return s;
}

Status Status::Locked(LockInfo info) {
  Status s(kLocked, "key is locked");
  s.lock_info_ = std::make_shared<const LockInfo>(std::move(info));
  return s;
}

Status Status::Outdated(std::chrono::nanoseconds elapsed, const char* tag) {
  Status s(kOutdated, "deadline exceeded");
  s.elapsed_ = elapsed;
  s.tag_ = tag;
  return s;
}

Status Status::Full() { return Status(kFull, "running batches reach limit"); }

Status Status::Other(std::string message) {
  return Status(kOther, std::move(message));
}

const RegionError& Status::region_error() const {
  if (region_error_ == nullptr) {
    return RegionError::default_instance();
  }
  return *region_error_;
}

const LockInfo& Status::lock_info() const {
  if (lock_info_ == nullptr) {
    return LockInfo::default_instance();
  }
  return *lock_info_;
}

const char* Status::KindName() const {
  switch (code_) {
    case kOk:
      return "ok";
    case kRegion:
      return "region";
    case kLocked:
      return "lock";
    case kOutdated:
      return "outdated";
    case kFull:
      return "full";
    case kOther:
      return "other";
  }
  return "unknown";
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::ostringstream ss;
  ss << KindName() << ": " << message_;
  if (code_ == kOutdated) {
    ss << " (tag=" << tag_ << ", elapsed=" << ToMillis(elapsed_) << "ms)";
  } else if (code_ == kLocked) {
    ss << " (lock_version=" << lock_info().lock_version() << ")";
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.ToString();
}

}  // namespace copr
