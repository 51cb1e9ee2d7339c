#ifndef __LD_LOG_HANDLER__
#define __LD_LOG_HANDLER__

#include "Headers.hpp"

namespace ld {
/**
 * @brief easylogging++ setup shared by the dashboard binary and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration.
   *
   * Nothing is applied until the caller reconfigures the default logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a new file under `directory`.
   * @return The path of the log file.
   */
  static string setupLogFile(el::Configurations *conf, const string &directory,
                             const string &prefix, bool alsoToStdout,
                             const string &maxLogSize);

  /** @brief Reopens stderr on a new file under `directory`. */
  static void redirectStderr(const string &directory, const string &prefix);

  /** @brief The `stdout` logger prints bare messages, used for CLI output. */
  static void setupStdoutLogger();

  static void rolloutHandler(const char *filename, std::size_t size);

 private:
  static string newFileName(const string &prefix, const string &kind);
  static string createFile(const string &directory, const string &name);
};
}  // namespace ld
#endif  // __LD_LOG_HANDLER__
