#include "SocketHandler.hpp"

namespace ld {
void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = (char*)buf;
  size_t filled = 0;
  time_t lastProgress = time(NULL);
  while (filled < count) {
    if (!waitOnSocketData(fd)) {
      if (timeout && time(NULL) > lastProgress + SOCKET_STALL_TIMEOUT) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t n = read(fd, out + filled, count - filled);
    if (n > 0) {
      filled += n;
      lastProgress = time(NULL);
      continue;
    }
    if (n == 0) {
      VLOG(1) << "Peer closed fd " << fd;
      throw std::runtime_error("Connection closed by peer");
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      VLOG(1) << "read on fd " << fd << " failed: " << strerror(errno);
      throw std::runtime_error(string("Socket read failed: ") +
                               strerror(errno));
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* in = (const char*)buf;
  size_t sent = 0;
  time_t lastProgress = time(NULL);
  while (sent < count) {
    ssize_t n = write(fd, in + sent, count - sent);
    if (n > 0) {
      sent += n;
      lastProgress = time(NULL);
      continue;
    }
    if (n == 0) {
      throw std::runtime_error("Socket closed during write");
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      LOG(WARNING) << "write on fd " << fd << " failed: " << strerror(errno);
      throw std::runtime_error(string("Socket write failed: ") +
                               strerror(errno));
    }
    if (timeout && time(NULL) > lastProgress + SOCKET_STALL_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    // Send buffer is full
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace ld
