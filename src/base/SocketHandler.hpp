#ifndef __LD_SOCKET_HANDLER__
#define __LD_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace ld {
/**
 * @brief Socket operations used by the terminal listener. Tests swap in a
 * loopback implementation through this interface.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief One read() of at most `count` bytes.
   * @return Bytes read, 0 on orderly shutdown, -1 with errno set.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes as much of `buf` as the socket accepts.
   * @return Bytes written or -1 with errno set.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Fills `buf` with exactly `count` bytes.
   * @param timeout When true, give up after a stall of
   * SOCKET_STALL_TIMEOUT seconds. Otherwise wait indefinitely for the first
   * byte to arrive.
   * @throws std::runtime_error when the peer goes away or the stall bound is
   * hit.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes all `count` bytes.
   * @throws std::runtime_error on a write error or a stall.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /** @return The connected fd, or -1. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Binds every address of `endpoint` and starts listening.
   * @throws std::runtime_error when the port is unavailable.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @return The accepted fd, or -1 when nothing was pending. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;

  /** @brief Seconds without progress before a bounded transfer fails. */
  static const int SOCKET_STALL_TIMEOUT = 10;
};
}  // namespace ld

#endif  // __LD_SOCKET_HANDLER__
