#include "PortRanking.hpp"

namespace ld {
vector<int> rankCandidatePorts(const vector<int> &ports, size_t limit) {
  set<int> unique;
  for (int port : ports) {
    if (port > 0 && port <= 65535) {
      unique.insert(port);
    }
  }

  vector<int> ranked;
  for (int preferred : PREFERRED_HTTP_PORTS) {
    if (unique.erase(preferred)) {
      ranked.push_back(preferred);
    }
  }
  // std::set iterates in ascending order
  ranked.insert(ranked.end(), unique.begin(), unique.end());

  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
  return ranked;
}

string formatProbeUrl(const string &host, int port) {
  string hostPart = host;
  if (hostPart.find(':') != string::npos && !startsWith(hostPart, "[")) {
    hostPart = "[" + hostPart + "]";
  }
  return "http://" + hostPart + ":" + to_string(port) + "/";
}
}  // namespace ld
