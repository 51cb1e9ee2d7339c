#ifndef __LD_SOCKET_ENDPOINT__
#define __LD_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Where to listen or connect. An empty name listens on every local
 * address.
 */
class SocketEndpoint {
 public:
  explicit SocketEndpoint(int _port) : port(_port) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }
  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &endpoint) {
  return os << (endpoint.getName().empty() ? "*" : endpoint.getName()) << ":"
            << endpoint.getPort();
}
}  // namespace ld

#endif  // __LD_SOCKET_ENDPOINT__
