#include "copr/common/util.h"

#include <cstdio>
#include <sstream>

namespace copr {

void SplitString(const std::string& str, char delim,
                 std::vector<std::string>* tokens) {
  tokens->clear();
  std::stringstream ss(str);
  std::string token;
  while (std::getline(ss, token, delim)) {
    if (!token.empty()) {
      tokens->push_back(token);
    }
  }
}

std::string NextKey(const std::string& key) {
  std::string next = key;
  next.push_back('\0');
  return next;
}

bool IsPointRange(const KeyRange& range) {
  const auto& start = range.start();
  const auto& end = range.end();
  return end.size() == start.size() + 1 && end.back() == '\0' &&
         end.compare(0, start.size(), start) == 0;
}

std::string EscapeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (unsigned char c : key) {
    if (c >= 0x20 && c < 0x7f && c != '\\') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[5];
      snprintf(buf, sizeof(buf), "\\x%02x", c);
      out.append(buf);
    }
  }
  return out;
}

std::string RangeToString(const KeyRange& range) {
  return "[" + EscapeKey(range.start()) + ", " + EscapeKey(range.end()) + ")";
}

}  // namespace copr
