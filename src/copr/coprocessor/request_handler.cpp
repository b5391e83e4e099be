#include "copr/coprocessor/request_handler.h"

#include <glog/logging.h>

#include <cstdlib>

namespace copr {

void DieOnUnsupportedMode(const char* mode, const char* tag) {
  LOG(FATAL) << mode << " request is not supported for this handler (tag: "
             << tag << ")";
  std::abort();
}

}  // namespace copr
