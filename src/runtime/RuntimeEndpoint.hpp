#ifndef __LD_RUNTIME_ENDPOINT__
#define __LD_RUNTIME_ENDPOINT__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Where a container runtime listens: a local unix socket or a
 * `host:port` TCP address.
 */
class RuntimeEndpoint {
 public:
  /** @brief The well-known local engine socket. */
  RuntimeEndpoint() : socketPath(LOCAL_RUNTIME_SOCKET), port(-1) {}

  static RuntimeEndpoint unixSocket(const string &path) {
    RuntimeEndpoint endpoint;
    endpoint.socketPath = path;
    return endpoint;
  }

  static RuntimeEndpoint tcp(const string &host, int port) {
    RuntimeEndpoint endpoint;
    endpoint.socketPath = "";
    endpoint.host = host;
    endpoint.port = port;
    return endpoint;
  }

  bool isLocal() const { return !socketPath.empty(); }

  const string &getSocketPath() const { return socketPath; }

  const string &getHost() const { return host; }

  int getPort() const { return port; }

  /**
   * @brief `unix:///path` or `tcp://host:port`; also the connection cache
   * key.
   */
  string getUrl() const {
    if (isLocal()) {
      return "unix://" + socketPath;
    }
    return "tcp://" + host + ":" + to_string(port);
  }

  bool operator==(const RuntimeEndpoint &other) const {
    return getUrl() == other.getUrl();
  }

  bool operator!=(const RuntimeEndpoint &other) const {
    return !(*this == other);
  }

 protected:
  string socketPath;
  string host;
  int port;
};

inline ostream &operator<<(ostream &os, const RuntimeEndpoint &self) {
  return os << self.getUrl();
}
}  // namespace ld

#endif  // __LD_RUNTIME_ENDPOINT__
