#ifndef COPR_COMMON_CONFIG_H_
#define COPR_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace copr {

constexpr int64_t kReqTypeDag = 103;
constexpr int64_t kReqTypeAnalyze = 104;
constexpr int64_t kReqTypeChecksum = 105;

constexpr int kDefaultRequestMaxHandleSecs = 60;
constexpr int kDefaultSlowLogThresholdMs = 1000;
constexpr int kDefaultRecursionLimit = 1000;
constexpr size_t kDefaultBatchRowLimit = 64;
constexpr size_t kDefaultStreamBatchRowLimit = 128;
constexpr size_t kDefaultReadPoolConcurrency = 4;
constexpr size_t kDefaultMaxTasksPerWorker = 2000;

}  // namespace copr

#endif  // COPR_COMMON_CONFIG_H_
