#include "TerminalServer.hpp"

#include "TerminalSession.hpp"
#include "WebSocketCodec.hpp"

#define MAX_REQUEST_HEAD (16 * 1024)

namespace ld {
const string TerminalServer::TERMINAL_PATH = "/echo";

TerminalServer::TerminalServer(shared_ptr<SocketHandler> _socketHandler,
                               const SocketEndpoint &_serverEndpoint,
                               shared_ptr<ConnectionCache> _connectionCache,
                               shared_ptr<ServerRegistry> _registry)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      connectionCache(_connectionCache),
      registry(_registry) {
  socketHandler->listen(serverEndpoint);
  LOG(INFO) << "Terminal server listening on " << serverEndpoint;
}

TerminalServer::~TerminalServer() {
  shutdown();
  lock_guard<std::mutex> guard(terminalThreadMutex);
  for (auto &it : terminalThreads) {
    if (it.worker->joinable()) {
      it.worker->detach();
    }
  }
}

void TerminalServer::run() {
  fd_set coreFds;
  int numCoreFds = 0;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
    numCoreFds++;
  }
  if (numCoreFds > FD_SETSIZE) {
    LOG(FATAL) << "Tried to select() on too many FDs";
  }

  while (true) {
    {
      lock_guard<std::mutex> guard(terminalThreadMutex);
      if (halt) {
        break;
      }
    }
    reapFinishedThreads();

    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : serverPortFds) {
      if (!FD_ISSET(i, &rfds)) {
        continue;
      }
      int clientFd = socketHandler->accept(i);
      if (clientFd < 0) {
        continue;
      }
      VLOG(1) << "Accepted terminal connection on fd " << clientFd;
      SessionThread sessionThread;
      sessionThread.done.reset(new atomic<bool>(false));
      auto done = sessionThread.done;
      sessionThread.worker.reset(new thread([this, clientFd, done]() {
        handleConnection(clientFd);
        *done = true;
      }));
      lock_guard<std::mutex> guard(terminalThreadMutex);
      terminalThreads.push_back(sessionThread);
    }
  }

  socketHandler->stopListening(serverEndpoint);
  vector<SessionThread> threads;
  {
    lock_guard<std::mutex> guard(terminalThreadMutex);
    for (auto &it : activeChannels) {
      it.second->interrupt();
    }
    threads.swap(terminalThreads);
  }
  for (auto &it : threads) {
    it.worker->join();
  }
  LOG(INFO) << "Terminal server stopped";
}

void TerminalServer::shutdown() {
  lock_guard<std::mutex> guard(terminalThreadMutex);
  halt = true;
}

void TerminalServer::reapFinishedThreads() {
  vector<SessionThread> finished;
  {
    lock_guard<std::mutex> guard(terminalThreadMutex);
    auto it = terminalThreads.begin();
    while (it != terminalThreads.end()) {
      if (*(it->done)) {
        finished.push_back(*it);
        it = terminalThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &it : finished) {
    it.worker->join();
  }
}

bool TerminalServer::readRequestHead(int fd, string *head) {
  head->clear();
  char c;
  while (head->size() < MAX_REQUEST_HEAD) {
    socketHandler->readAll(fd, &c, 1, true);
    head->push_back(c);
    if (head->size() >= 4 &&
        head->compare(head->size() - 4, 4, "\r\n\r\n") == 0) {
      return true;
    }
  }
  return false;
}

void TerminalServer::rejectConnection(int fd, int status,
                                      const string &message) {
  LOG(INFO) << "Rejecting terminal connection: " << message;
  string response = WebSocketCodec::buildErrorResponse(status, message);
  try {
    socketHandler->writeAllOrThrow(fd, response.data(), response.size(),
                                   true);
  } catch (const std::runtime_error &e) {
    VLOG(1) << "Could not send rejection: " << e.what();
  }
  socketHandler->close(fd);
}

void TerminalServer::handleConnection(int clientFd) {
  el::Helpers::setThreadName("terminal-" + to_string(clientFd));
  string head;
  try {
    if (!readRequestHead(clientFd, &head)) {
      rejectConnection(clientFd, 431, "Request head too large");
      return;
    }
  } catch (const std::runtime_error &e) {
    VLOG(1) << "Handshake read failed: " << e.what();
    socketHandler->close(clientFd);
    return;
  }

  WebSocketRequest request;
  string error;
  if (!WebSocketCodec::parseUpgradeRequest(head, &request, &error)) {
    rejectConnection(clientFd, 400, error);
    return;
  }
  if (request.path != TERMINAL_PATH) {
    rejectConnection(clientFd, 404, "Unknown path " + request.path);
    return;
  }

  string response =
      WebSocketCodec::buildAcceptResponse(request.headers["sec-websocket-key"]);
  try {
    socketHandler->writeAllOrThrow(clientFd, response.data(), response.size(),
                                   true);
  } catch (const std::runtime_error &e) {
    VLOG(1) << "Handshake write failed: " << e.what();
    socketHandler->close(clientFd);
    return;
  }

  shared_ptr<WebSocketChannel> channel(
      new WebSocketChannel(socketHandler, clientFd));
  {
    lock_guard<std::mutex> guard(terminalThreadMutex);
    if (halt) {
      channel->close();
      return;
    }
    activeChannels[clientFd] = channel;
  }

  string containerId;
  auto it = request.query.find("id");
  if (it != request.query.end()) {
    containerId = it->second;
  }
  TerminalSession session(channel, connectionCache, registry, containerId);
  session.run();

  lock_guard<std::mutex> guard(terminalThreadMutex);
  // The fd may already belong to a newer connection
  auto active = activeChannels.find(clientFd);
  if (active != activeChannels.end() && active->second == channel) {
    activeChannels.erase(active);
  }
}

size_t TerminalServer::getActiveSessionCount() {
  lock_guard<std::mutex> guard(terminalThreadMutex);
  return activeChannels.size();
}
}  // namespace ld
