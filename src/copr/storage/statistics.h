#ifndef COPR_STORAGE_STATISTICS_H_
#define COPR_STORAGE_STATISTICS_H_

#include <cstdint>

namespace copr {
namespace storage {

struct ScanStatistics {
  // Versions and tombstones touched while reading.
  int64_t total = 0;
  // Visible pairs returned to the caller.
  int64_t processed = 0;

  void Add(const ScanStatistics& other) {
    total += other.total;
    processed += other.processed;
  }
};

}  // namespace storage
}  // namespace copr

#endif  // COPR_STORAGE_STATISTICS_H_
