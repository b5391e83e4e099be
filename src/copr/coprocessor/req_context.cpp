#include "copr/coprocessor/req_context.h"

#include <utility>

namespace copr {

ReqContext::ReqContext(const char* tag, Context context,
                       const KeyRanges& ranges,
                       std::optional<std::string> peer,
                       std::optional<bool> is_desc_scan,
                       std::optional<uint64_t> txn_start_ts)
    : tag(tag),
      context(std::move(context)),
      ranges_len(ranges.size()),
      deadline(Deadline::FromNow(tag, std::chrono::seconds(0))),
      peer(std::move(peer)),
      is_desc_scan(is_desc_scan),
      txn_start_ts(txn_start_ts) {
  if (!ranges.empty()) {
    first_range = ranges.Get(0);
  }
}

void ReqContext::SetMaxHandleDuration(
    std::chrono::nanoseconds max_handle_duration) {
  deadline.Reset(max_handle_duration);
}

ReqContext ReqContext::DefaultForTest() {
  return ReqContext("test", Context(), KeyRanges(), std::nullopt, std::nullopt,
                    std::nullopt);
}

}  // namespace copr
