#ifndef COPR_COPROCESSOR_DEADLINE_H_
#define COPR_COPROCESSOR_DEADLINE_H_

#include <chrono>

#include "copr/common/status.h"
#include "copr/common/time_util.h"

namespace copr {

/*!
 * \brief Time budget of a single request, measured on the coarse monotonic
 *   clock.
 */
class Deadline {
 public:
  Deadline(const char* tag, CoarseTimePoint start_time,
           std::chrono::nanoseconds after_duration);

  /*! \brief Initializes a deadline counting from now. */
  static Deadline FromNow(const char* tag,
                          std::chrono::nanoseconds after_duration);

  /*!
   * \brief Recomputes the deadline from the original start time, so time
   *   already spent in queues counts against the new budget.
   */
  void Reset(std::chrono::nanoseconds after_duration);

  /*! \brief Returns Outdated once the deadline has passed. */
  Status CheckIfExceeded() const;
  Status CheckIfExceeded(CoarseTimePoint now) const;

  const char* tag() const { return tag_; }
  CoarseTimePoint start_time() const { return start_time_; }
  CoarseTimePoint deadline() const { return deadline_; }

 private:
  const char* tag_;
  CoarseTimePoint start_time_;
  CoarseTimePoint deadline_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_DEADLINE_H_
