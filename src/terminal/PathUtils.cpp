#include "PathUtils.hpp"

namespace ld {
string normalizePosixPath(const string &path) {
  vector<string> segments;
  for (const auto &segment : split(path, '/')) {
    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    segments.push_back(segment);
  }
  if (segments.empty()) {
    return "/";
  }
  string normalized;
  for (const auto &segment : segments) {
    normalized += "/" + segment;
  }
  return normalized;
}

string joinPosixPath(const string &base, const string &argument) {
  if (startsWith(argument, "/")) {
    return argument;
  }
  if (base.empty() || base.back() == '/') {
    return base + argument;
  }
  return base + "/" + argument;
}
}  // namespace ld
