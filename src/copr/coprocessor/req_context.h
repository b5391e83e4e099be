#ifndef COPR_COPROCESSOR_REQ_CONTEXT_H_
#define COPR_COPROCESSOR_REQ_CONTEXT_H_

#include <google/protobuf/repeated_field.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "copr/coprocessor/deadline.h"
#include "copr/proto/coprocessor.pb.h"

namespace copr {

using KeyRanges = google::protobuf::RepeatedPtrField<KeyRange>;

/*!
 * \brief Metadata of one coprocessor request. Owned by the handler serving
 *   the request.
 */
struct ReqContext {
  ReqContext(const char* tag, Context context, const KeyRanges& ranges,
             std::optional<std::string> peer, std::optional<bool> is_desc_scan,
             std::optional<uint64_t> txn_start_ts);

  // TODO: build the deadline with the real budget once the read pool reports
  // queueing delay at submission, and drop this setter.
  void SetMaxHandleDuration(std::chrono::nanoseconds max_handle_duration);

  static ReqContext DefaultForTest();

  /*! \brief Kind of the request, e.g. "select" or "checksum_table". */
  const char* tag;
  /*! \brief Rpc context carried in the request. */
  Context context;
  /*! \brief First range of the request. Absent when there is no range. */
  std::optional<KeyRange> first_range;
  size_t ranges_len;
  Deadline deadline;
  /*! \brief Address of the client, for diagnostics. */
  std::optional<std::string> peer;
  /*! \brief Only set for DAG requests. */
  std::optional<bool> is_desc_scan;
  std::optional<uint64_t> txn_start_ts;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_REQ_CONTEXT_H_
