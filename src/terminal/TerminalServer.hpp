#ifndef __LD_TERMINAL_SERVER__
#define __LD_TERMINAL_SERVER__

#include "ConnectionCache.hpp"
#include "Headers.hpp"
#include "ServerRegistry.hpp"
#include "SocketHandler.hpp"
#include "WebSocketChannel.hpp"

namespace ld {
/**
 * @brief Accepts WebSocket connections on `/echo?id=<container>` and runs a
 * TerminalSession for each on its own thread.
 */
class TerminalServer {
 public:
  /**
   * @brief Starts listening on `_serverEndpoint`.
   * @throws std::runtime_error when the port cannot be bound.
   */
  TerminalServer(shared_ptr<SocketHandler> _socketHandler,
                 const SocketEndpoint &_serverEndpoint,
                 shared_ptr<ConnectionCache> _connectionCache,
                 shared_ptr<ServerRegistry> _registry);
  virtual ~TerminalServer();

  /**
   * @brief Accept loop. Returns after shutdown() once every session thread
   * has finished.
   */
  void run();

  /** @brief Stops the accept loop and ends live sessions. */
  void shutdown();

  /**
   * @brief Performs the upgrade handshake on an accepted socket, then runs
   * the session until the connection ends.
   */
  void handleConnection(int clientFd);

  size_t getActiveSessionCount();

  /** @brief Request path terminal clients connect to. */
  static const string TERMINAL_PATH;

 protected:
  /**
   * @brief Reads the HTTP request head up to the blank line.
   * @return false when the head is too large.
   */
  bool readRequestHead(int fd, string *head);
  void rejectConnection(int fd, int status, const string &message);
  /** @brief Joins session threads that have finished. */
  void reapFinishedThreads();

  struct SessionThread {
    shared_ptr<thread> worker;
    shared_ptr<atomic<bool>> done;
  };

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<ConnectionCache> connectionCache;
  shared_ptr<ServerRegistry> registry;

  /** @brief Threads that run handshakes and sessions. */
  vector<SessionThread> terminalThreads;
  /** @brief Upgraded connections, by fd. */
  map<int, shared_ptr<WebSocketChannel>> activeChannels;
  /** @brief Flag that stops the accept loop when true. */
  bool halt = false;
  /** @brief Guards `terminalThreads`, `activeChannels` and `halt`. */
  mutex terminalThreadMutex;
};
}  // namespace ld

#endif  // __LD_TERMINAL_SERVER__
