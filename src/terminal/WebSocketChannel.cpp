#include "WebSocketChannel.hpp"

namespace ld {
WebSocketChannel::WebSocketChannel(shared_ptr<SocketHandler> _socketHandler,
                                   int _fd)
    : socketHandler(_socketHandler), fd(_fd), closed(false), closeSent(false) {}

WebSocketChannel::~WebSocketChannel() { close(); }

WebSocketFrame WebSocketChannel::readFrame() {
  string buffer(2, '\0');
  socketHandler->readAll(fd, &buffer[0], 2, false);
  size_t header = WebSocketCodec::headerLength(uint8_t(buffer[0]),
                                               uint8_t(buffer[1]));
  if (header > 2) {
    buffer.resize(header);
    socketHandler->readAll(fd, &buffer[2], header - 2, true);
  }

  WebSocketFrame frame;
  size_t consumed = WebSocketCodec::decodeFrame(buffer, &frame);
  while (consumed == 0) {
    // Header is complete, so decodeFrame only lacks payload bytes here
    uint8_t lengthCode = uint8_t(buffer[1]) & 0x7F;
    uint64_t length = lengthCode;
    if (lengthCode == 126) {
      length = (uint64_t(uint8_t(buffer[2])) << 8) | uint8_t(buffer[3]);
    } else if (lengthCode == 127) {
      length = 0;
      for (int i = 0; i < 8; i++) {
        length = (length << 8) | uint8_t(buffer[2 + i]);
      }
    }
    size_t start = buffer.size();
    buffer.resize(header + length);
    socketHandler->readAll(fd, &buffer[start], buffer.size() - start, true);
    consumed = WebSocketCodec::decodeFrame(buffer, &frame);
  }
  if (!frame.masked) {
    throw std::runtime_error("Client sent an unmasked WebSocket frame");
  }
  return frame;
}

void WebSocketChannel::writeFrame(uint8_t opcode, const string &payload) {
  string frame = WebSocketCodec::encodeFrame(opcode, payload);
  lock_guard<recursive_mutex> guard(channelMutex);
  if (closed) {
    throw std::runtime_error("WebSocket channel is closed");
  }
  socketHandler->writeAllOrThrow(fd, frame.data(), frame.size(), true);
}

bool WebSocketChannel::receive(string *message) {
  if (isClosed()) {
    return false;
  }
  string assembled;
  bool inMessage = false;
  while (true) {
    WebSocketFrame frame;
    try {
      frame = readFrame();
    } catch (const std::runtime_error &e) {
      lock_guard<recursive_mutex> guard(channelMutex);
      if (closed) {
        return false;
      }
      throw;
    }
    switch (frame.opcode) {
      case WS_TEXT:
      case WS_BINARY:
        if (inMessage) {
          throw std::runtime_error("New message before the previous finished");
        }
        assembled = frame.payload;
        inMessage = true;
        break;
      case WS_CONTINUATION:
        if (!inMessage) {
          throw std::runtime_error("Continuation frame without a message");
        }
        assembled += frame.payload;
        if (assembled.size() > WS_MAX_PAYLOAD) {
          throw std::runtime_error("WebSocket message too large");
        }
        break;
      case WS_PING:
        writeFrame(WS_PONG, frame.payload);
        continue;
      case WS_PONG:
        continue;
      case WS_CLOSE: {
        VLOG(1) << "Peer closed WebSocket on fd " << fd;
        {
          lock_guard<recursive_mutex> guard(channelMutex);
          if (!closeSent && !closed) {
            closeSent = true;
            // Echo the status code only
            string status = frame.payload.substr(0, 2);
            string reply = WebSocketCodec::encodeFrame(WS_CLOSE, status);
            try {
              socketHandler->writeAllOrThrow(fd, reply.data(), reply.size(),
                                             true);
            } catch (const std::runtime_error &e) {
              VLOG(1) << "Could not answer close frame: " << e.what();
            }
          }
        }
        return false;
      }
      default:
        throw std::runtime_error("Unknown WebSocket opcode " +
                                 to_string(int(frame.opcode)));
    }
    if (frame.fin) {
      *message = assembled;
      return true;
    }
  }
}

void WebSocketChannel::send(const string &message) {
  writeFrame(WS_TEXT, message);
}

void WebSocketChannel::close() {
  lock_guard<recursive_mutex> guard(channelMutex);
  if (closed) {
    return;
  }
  if (!closeSent) {
    closeSent = true;
    string frame = WebSocketCodec::encodeFrame(
        WS_CLOSE, WebSocketCodec::encodeClosePayload(WS_CLOSE_NORMAL, ""));
    try {
      socketHandler->writeAllOrThrow(fd, frame.data(), frame.size(), true);
    } catch (const std::runtime_error &e) {
      VLOG(1) << "Could not send close frame: " << e.what();
    }
  }
  closed = true;
  socketHandler->close(fd);
}

void WebSocketChannel::interrupt() {
  lock_guard<recursive_mutex> guard(channelMutex);
  if (!closed) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

bool WebSocketChannel::isClosed() {
  lock_guard<recursive_mutex> guard(channelMutex);
  return closed;
}
}  // namespace ld
