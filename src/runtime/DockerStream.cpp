#include "DockerStream.hpp"

namespace ld {
bool DockerStream::looksMultiplexed(const string &raw) {
  if (raw.size() < HEADER_SIZE) {
    return false;
  }
  auto streamType = (unsigned char)raw[0];
  return streamType <= 2 && raw[1] == 0 && raw[2] == 0 && raw[3] == 0;
}

string DockerStream::demultiplex(const string &raw, bool keepStdout,
                                 bool keepStderr) {
  if (!looksMultiplexed(raw)) {
    return raw;
  }
  string out;
  size_t offset = 0;
  while (offset + HEADER_SIZE <= raw.size()) {
    auto header = (const unsigned char *)raw.data() + offset;
    int streamType = header[0];
    uint32_t length = (uint32_t(header[4]) << 24) |
                      (uint32_t(header[5]) << 16) |
                      (uint32_t(header[6]) << 8) | uint32_t(header[7]);
    offset += HEADER_SIZE;
    size_t available = min<size_t>(length, raw.size() - offset);
    if (available < length) {
      LOG(WARNING) << "Truncated stream frame: expected " << length
                   << " bytes, got " << available;
    }
    bool keep = (streamType == 2) ? keepStderr : keepStdout;
    if (keep) {
      out.append(raw, offset, available);
    }
    offset += available;
  }
  return out;
}
}  // namespace ld
