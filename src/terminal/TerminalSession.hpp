#ifndef __LD_TERMINAL_SESSION__
#define __LD_TERMINAL_SESSION__

#include "ConnectionCache.hpp"
#include "Headers.hpp"
#include "ServerRegistry.hpp"
#include "TerminalChannel.hpp"

namespace ld {
/** @brief Tells the browser to wipe the terminal scrollback. */
const string CLEAR_SENTINEL = "__CLEAR__";

/**
 * @brief A command shell proxying one terminal connection into a container.
 *
 * The session owns the working directory for its connection. A few commands
 * are answered locally; everything else is executed inside the container in
 * the current working directory. A failed command never ends the session.
 */
class TerminalSession {
 public:
  TerminalSession(shared_ptr<TerminalChannel> _channel,
                  shared_ptr<ConnectionCache> _connectionCache,
                  shared_ptr<ServerRegistry> _registry,
                  const string &_containerId);

  /** @brief open(), then the command loop until the connection ends. */
  void run();

  /**
   * @brief Resolves the runtime client and the container. On failure a
   * single diagnostic is sent and the channel is closed.
   */
  bool open();

  /**
   * @brief Handles one line of input.
   * @return false when the session should end.
   */
  bool handleLine(const string &line);

  const string &getId() const { return id; }

  const string &getWorkingDirectory() const { return workingDirectory; }

  static const string HELP_TEXT;

 protected:
  void dispatch(const string &command);
  void reply(const string &message);

  string id;
  shared_ptr<TerminalChannel> channel;
  shared_ptr<ConnectionCache> connectionCache;
  shared_ptr<ServerRegistry> registry;
  string containerId;
  shared_ptr<ContainerHandle> container;
  string workingDirectory;
};
}  // namespace ld

#endif  // __LD_TERMINAL_SESSION__
