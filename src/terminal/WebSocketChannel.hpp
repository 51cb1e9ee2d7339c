#ifndef __LD_WEBSOCKET_CHANNEL__
#define __LD_WEBSOCKET_CHANNEL__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "TerminalChannel.hpp"
#include "WebSocketCodec.hpp"

namespace ld {
/**
 * @brief Server side of an upgraded WebSocket connection.
 *
 * Fragmented messages are reassembled, pings are answered and a close
 * frame from the peer ends the channel.
 */
class WebSocketChannel : public TerminalChannel {
 public:
  WebSocketChannel(shared_ptr<SocketHandler> _socketHandler, int _fd);
  virtual ~WebSocketChannel();

  bool receive(string *message) override;
  void send(const string &message) override;
  /** @brief Sends a normal close frame and closes the socket. */
  void close() override;

  /**
   * @brief Wakes a thread blocked in receive() without closing the fd,
   * which stays owned by the session thread.
   */
  void interrupt();

  bool isClosed();

  int getFd() const { return fd; }

 protected:
  WebSocketFrame readFrame();
  void writeFrame(uint8_t opcode, const string &payload);

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  bool closed;
  bool closeSent;
  recursive_mutex channelMutex;
};
}  // namespace ld

#endif  // __LD_WEBSOCKET_CHANNEL__
