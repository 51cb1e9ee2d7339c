#ifndef __LD_TERMINAL_CHANNEL__
#define __LD_TERMINAL_CHANNEL__

#include "Headers.hpp"

namespace ld {
/**
 * @brief A message-oriented, bidirectional text connection carrying one
 * terminal session.
 */
class TerminalChannel {
 public:
  virtual ~TerminalChannel() {}

  /**
   * @brief Blocks until the next complete message arrives.
   * @return false once the peer has closed the channel.
   * @throws std::runtime_error on a transport or protocol failure.
   */
  virtual bool receive(string *message) = 0;

  /**
   * @throws std::runtime_error when the message cannot be delivered.
   */
  virtual void send(const string &message) = 0;

  /** @brief Closes the channel; further sends fail. Idempotent. */
  virtual void close() = 0;
};
}  // namespace ld

#endif  // __LD_TERMINAL_CHANNEL__
