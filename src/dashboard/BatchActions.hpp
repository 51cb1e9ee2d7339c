#ifndef __LD_BATCH_ACTIONS__
#define __LD_BATCH_ACTIONS__

#include "Headers.hpp"
#include "RuntimeClient.hpp"

namespace ld {
enum class ContainerAction { START, STOP, RESTART, DELETE };

struct BatchResult {
  int succeeded = 0;
  /** @brief Past tense of the action, e.g. "stopped". */
  string verb;
  /** @brief One message per container that failed. */
  vector<string> errors;
};

/**
 * @brief Applies one action to many containers. Failures are collected and
 * never stop the batch.
 */
class BatchActions {
 public:
  /** @brief Accepts Start, Stop, Restart and Delete in any case. */
  static optional<ContainerAction> parseAction(const string &name);

  static string pastTense(ContainerAction action);

  static BatchResult run(RuntimeClient &client, ContainerAction action,
                         const vector<string> &ids);

  /** @brief "<n> container(s) <verb>". */
  static string summarize(const BatchResult &result);
};
}  // namespace ld

#endif  // __LD_BATCH_ACTIONS__
