#include "TcpSocketHandler.hpp"

namespace ld {
TcpSocketHandler::TcpSocketHandler() {}

TcpSocketHandler::~TcpSocketHandler() {
  lock_guard<recursive_mutex> guard(handlerMutex);
  for (auto& it : listeners) {
    for (int fd : it.second) {
      ::close(fd);
    }
  }
  listeners.clear();
}

void TcpSocketHandler::track(int fd) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  if (!openSockets.insert(fd).second) {
    STFATAL << "fd " << fd << " is already tracked";
  }
}

bool TcpSocketHandler::isTracked(int fd) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  return openSockets.count(fd) > 0;
}

void TcpSocketHandler::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

ssize_t TcpSocketHandler::read(int fd, void* buf, size_t count) {
  if (!isTracked(fd)) {
    VLOG(1) << "read on untracked fd " << fd;
    errno = EPIPE;
    return -1;
  }
  ssize_t n = ::read(fd, buf, count);
  VLOG(4) << "read " << n << " bytes from fd " << fd;
  return n;
}

ssize_t TcpSocketHandler::write(int fd, const void* buf, size_t count) {
  if (!isTracked(fd)) {
    VLOG(1) << "write on untracked fd " << fd;
    errno = EPIPE;
    return -1;
  }
  ssize_t n = ::send(fd, buf, count, MSG_NOSIGNAL);
  VLOG(4) << "wrote " << n << " bytes to fd " << fd;
  return n;
}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(),
                       to_string(endpoint.getPort()).c_str(), &hints, &results);
  if (rc != 0) {
    LOG(WARNING) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    return -1;
  }

  int connected = -1;
  for (addrinfo* p = results; p != NULL && connected < 0; p = p->ai_next) {
    int fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) {
      VLOG(1) << "socket() failed: " << strerror(errno);
      continue;
    }
    setNonBlocking(fd);
    if (::connect(fd, p->ai_addr, p->ai_addrlen) < 0 && errno != EINPROGRESS) {
      VLOG(1) << "connect to " << endpoint << " failed: " << strerror(errno);
      ::close(fd);
      continue;
    }

    fd_set writable;
    FD_ZERO(&writable);
    FD_SET(fd, &writable);
    timeval tv;
    tv.tv_sec = CONNECT_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    if (select(fd + 1, NULL, &writable, NULL, &tv) <= 0) {
      VLOG(1) << "Timed out connecting to " << endpoint;
      ::close(fd);
      continue;
    }
    int socketError = 0;
    socklen_t length = sizeof(socketError);
    FATAL_FAIL(getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &length));
    if (socketError != 0) {
      VLOG(1) << "connect to " << endpoint
              << " failed: " << strerror(socketError);
      ::close(fd);
      continue;
    }
    connected = fd;
  }
  freeaddrinfo(results);

  if (connected < 0) {
    LOG(WARNING) << "Could not connect to " << endpoint;
    return -1;
  }
  track(connected);
  VLOG(1) << "Connected to " << endpoint << " on fd " << connected;
  return connected;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  int port = endpoint.getPort();
  if (listeners.count(port)) {
    STFATAL << "Already listening on port " << port;
  }

  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo* results = NULL;
  const char* bindName =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();
  int rc = getaddrinfo(bindName, to_string(port).c_str(), &hints, &results);
  if (rc != 0) {
    throw std::runtime_error("Cannot resolve bind address " +
                             endpoint.getName() + ": " + gai_strerror(rc));
  }

  set<int> fds;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    int fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) {
      VLOG(1) << "socket() failed for family " << p->ai_family << ": "
              << strerror(errno);
      continue;
    }
    setNonBlocking(fd);
    int on = 1;
    FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)));
    if (p->ai_family == AF_INET6) {
      // The IPv4 entry binds the same port separately
      FATAL_FAIL(setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on)));
    }
    if (::bind(fd, p->ai_addr, p->ai_addrlen) < 0) {
      int bindErrno = errno;
      ::close(fd);
      if (bindErrno == EADDRNOTAVAIL || bindErrno == EAFNOSUPPORT) {
        // e.g. IPv6 disabled on this host
        VLOG(1) << "Skipping address family " << p->ai_family << ": "
                << strerror(bindErrno);
        continue;
      }
      string error = "Cannot bind port " + to_string(port) + ": " +
                     strerror(bindErrno);
      for (int opened : fds) {
        ::close(opened);
      }
      freeaddrinfo(results);
      LOG(ERROR) << error;
      throw std::runtime_error(error);
    }
    FATAL_FAIL(::listen(fd, 32));
    fds.insert(fd);
  }
  freeaddrinfo(results);

  if (fds.empty()) {
    throw std::runtime_error("No address to listen on for " +
                             to_string(port));
  }
  LOG(INFO) << "Listening on " << endpoint << " with " << fds.size()
            << " sockets";
  listeners[port] = fds;
  return fds;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  auto it = listeners.find(endpoint.getPort());
  if (it == listeners.end()) {
    STFATAL << "Not listening on " << endpoint;
  }
  return it->second;
}

int TcpSocketHandler::accept(int listenFd) {
  sockaddr_storage peer;
  socklen_t peerLength = sizeof(peer);
  int fd = ::accept(listenFd, (sockaddr*)&peer, &peerLength);
  if (fd < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      LOG(WARNING) << "accept failed: " << strerror(errno);
    }
    return -1;
  }
  // A recycled fd can show up before close() on the old one has returned
  while (isTracked(fd)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  setNonBlocking(fd);
  int on = 1;
  FATAL_FAIL(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)));
  track(fd);
  VLOG(3) << "Accepted fd " << fd << " on listener " << listenFd;
  return fd;
}

void TcpSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  auto it = listeners.find(endpoint.getPort());
  if (it == listeners.end()) {
    LOG(WARNING) << "Not listening on " << endpoint;
    return;
  }
  for (int fd : it->second) {
    ::close(fd);
  }
  listeners.erase(it);
}

void TcpSocketHandler::close(int fd) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  if (!openSockets.count(fd)) {
    VLOG(1) << "close on untracked fd " << fd;
    return;
  }
  VLOG(1) << "Closing fd " << fd;
  FATAL_FAIL(::close(fd));
  openSockets.erase(fd);
}
}  // namespace ld
