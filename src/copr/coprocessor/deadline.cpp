#include "copr/coprocessor/deadline.h"

#include <glog/logging.h>

namespace copr {

Deadline::Deadline(const char* tag, CoarseTimePoint start_time,
                   std::chrono::nanoseconds after_duration)
    : tag_(tag), start_time_(start_time) {
  Reset(after_duration);
}

Deadline Deadline::FromNow(const char* tag,
                           std::chrono::nanoseconds after_duration) {
  return Deadline(tag, CoarseMonotonicClock::now(), after_duration);
}

void Deadline::Reset(std::chrono::nanoseconds after_duration) {
  CHECK(after_duration.count() >= 0) << "Negative budget for " << tag_;
  deadline_ = start_time_ + after_duration;
}

Status Deadline::CheckIfExceeded() const {
  return CheckIfExceeded(CoarseMonotonicClock::now());
}

Status Deadline::CheckIfExceeded(CoarseTimePoint now) const {
  if (deadline_ <= now) {
    return Status::Outdated(now - start_time_, tag_);
  }
  return Status::OK();
}

}  // namespace copr
