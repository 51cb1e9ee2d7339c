#ifndef __LD_TCP_SOCKET_HANDLER__
#define __LD_TCP_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace ld {
/**
 * @brief Non-blocking IPv4/IPv6 TCP sockets.
 *
 * Every fd handed out by accept() or connect() is tracked until close(), so
 * a descriptor the kernel recycles is never confused with one still being
 * torn down.
 */
class TcpSocketHandler : public SocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler();

  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);

  /** @brief Connects with a CONNECT_TIMEOUT_SECONDS bound per address. */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Listens on the endpoint's address, or on every local address when
   * the name is empty.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);

  static const int CONNECT_TIMEOUT_SECONDS = 3;

 protected:
  void track(int fd);
  bool isTracked(int fd);
  void setNonBlocking(int fd);

  /** @brief Client fds from accept() and connect(). */
  set<int> openSockets;
  /** @brief Listening fds per port. */
  map<int, set<int>> listeners;
  recursive_mutex handlerMutex;
};
}  // namespace ld

#endif  // __LD_TCP_SOCKET_HANDLER__
