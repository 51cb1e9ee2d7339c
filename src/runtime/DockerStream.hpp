#ifndef __LD_DOCKER_STREAM__
#define __LD_DOCKER_STREAM__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Docker multiplexes stdout and stderr of non-tty streams into frames
 * with an 8 byte header: stream type, three zero bytes, big endian length.
 */
class DockerStream {
 public:
  static const int HEADER_SIZE = 8;

  /**
   * @brief Concatenates the payloads of all frames in `raw`, optionally
   * dropping one of the two streams. Input that does not start with a valid
   * frame header is returned unchanged (tty streams are not multiplexed).
   */
  static string demultiplex(const string &raw, bool keepStdout = true,
                            bool keepStderr = true);

  /** @brief True when `raw` begins with a well formed frame header. */
  static bool looksMultiplexed(const string &raw);
};
}  // namespace ld

#endif  // __LD_DOCKER_STREAM__
