#ifndef COPR_COMMON_UTIL_H_
#define COPR_COMMON_UTIL_H_

#include <string>
#include <vector>

#include "copr/proto/coprocessor.pb.h"

namespace copr {

void SplitString(const std::string& str, char delim,
                 std::vector<std::string>* tokens);

/*! \brief Smallest key that sorts after `key`. */
std::string NextKey(const std::string& key);

/*! \brief Whether the range covers exactly one key. */
bool IsPointRange(const KeyRange& range);

/*! \brief Printable form of a binary key, non-printable bytes as \xHH. */
std::string EscapeKey(const std::string& key);

std::string RangeToString(const KeyRange& range);

}  // namespace copr

#endif  // COPR_COMMON_UTIL_H_
