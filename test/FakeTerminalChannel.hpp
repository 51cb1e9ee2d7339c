#ifndef __LD_FAKE_TERMINAL_CHANNEL__
#define __LD_FAKE_TERMINAL_CHANNEL__

#include "Headers.hpp"
#include "TerminalChannel.hpp"

namespace ld {
/**
 * @brief Replays scripted input lines and records every reply.
 */
class FakeTerminalChannel : public TerminalChannel {
 public:
  explicit FakeTerminalChannel(const vector<string> &lines = {})
      : inputs(lines.begin(), lines.end()),
        closed(false),
        closeCount(0),
        failWhenDrained(false) {}

  bool receive(string *message) override {
    if (closed) {
      return false;
    }
    if (inputs.empty()) {
      if (failWhenDrained) {
        throw std::runtime_error("Connection reset by peer");
      }
      return false;
    }
    *message = inputs.front();
    inputs.pop_front();
    return true;
  }

  void send(const string &message) override {
    if (closed) {
      throw std::runtime_error("send on closed channel");
    }
    sent.push_back(message);
  }

  void close() override {
    closed = true;
    closeCount++;
  }

  deque<string> inputs;
  vector<string> sent;
  bool closed;
  int closeCount;
  /** @brief Throw a transport error instead of reporting a clean close. */
  bool failWhenDrained;
};
}  // namespace ld

#endif  // __LD_FAKE_TERMINAL_CHANNEL__
