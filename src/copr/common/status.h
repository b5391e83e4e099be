#ifndef COPR_COMMON_STATUS_H_
#define COPR_COMMON_STATUS_H_

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

#include "copr/proto/coprocessor.pb.h"

namespace copr {

/*!
 * \brief Outcome of a fallible coprocessor operation.
 *
 * Every error that may reach a client travels as a Status value. Region and
 * lock errors carry the protobuf payload that ends up in the response.
 */
class Status {
 public:
  enum Code {
    kOk = 0,
    kRegion,
    kLocked,
    kOutdated,
    kFull,
    kOther,
  };

  Status() : code_(kOk) {}

  static Status OK() { return Status(); }
  static Status Region(RegionError error);
  static Status Locked(LockInfo info);
  static Status Outdated(std::chrono::nanoseconds elapsed, const char* tag);
  static Status Full();
  static Status Other(std::string message);

  bool ok() const { return code_ == kOk; }
  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  // Only meaningful for kOutdated.
  std::chrono::nanoseconds elapsed() const { return elapsed_; }
  const char* tag() const { return tag_; }

  // Only meaningful for kRegion and kLocked respectively.
  const RegionError& region_error() const;
  const LockInfo& lock_info() const;

  /*! \brief Short label of the code, used as a metrics key. */
  const char* KindName() const;
  std::string ToString() const;

 private:
  Status(Code code, std::string message);

  Code code_;
  std::string message_;
  std::chrono::nanoseconds elapsed_{0};
  const char* tag_ = "";
  std::shared_ptr<const RegionError> region_error_;
  std::shared_ptr<const LockInfo> lock_info_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace copr

#define COPR_RETURN_IF_ERROR(expr)          \
  do {                                      \
    ::copr::Status _copr_status = (expr);   \
    if (!_copr_status.ok()) {               \
      return _copr_status;                  \
    }                                       \
  } while (0)

#endif  // COPR_COMMON_STATUS_H_
