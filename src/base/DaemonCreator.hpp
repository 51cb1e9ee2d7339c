#ifndef __LD_DAEMON_CREATOR__
#define __LD_DAEMON_CREATOR__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Detaches the dashboard from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session and points stdio at /dev/null.
   * @param childPidFile Written by the daemon with its pid, unless empty.
   * @return CHILD inside the daemon, -1 when a fork or setsid fails. The
   * original process exits.
   */
  static int create(const string &childPidFile);

  static const int CHILD = 2;
};
}  // namespace ld

#endif  // __LD_DAEMON_CREATOR__
