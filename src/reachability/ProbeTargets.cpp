#include "ProbeTargets.hpp"

#include "PortRanking.hpp"

namespace ld {
string resolveProbeHost(const PortMapping &mapping,
                        const RuntimeEndpoint &endpoint) {
  const string &ip = mapping.ip;
  if (!ip.empty() && ip != "0.0.0.0" && ip != "::") {
    return ip;
  }
  if (!endpoint.isLocal()) {
    return endpoint.getHost();
  }
  return "127.0.0.1";
}

optional<ProbeTask> buildProbeTask(const string &containerId,
                                   const vector<PortMapping> &ports,
                                   const RuntimeEndpoint &endpoint) {
  vector<int> published;
  for (const auto &mapping : ports) {
    if (mapping.publicPort > 0 && mapping.type == "tcp") {
      published.push_back(mapping.publicPort);
    }
  }
  auto ranked = rankCandidatePorts(published);
  if (ranked.empty()) {
    return nullopt;
  }

  ProbeTask task;
  task.containerId = containerId;
  task.candidatePorts = ranked;
  // Docker lists each port once per address family; take the binding of the
  // best-ranked port
  for (const auto &mapping : ports) {
    if (mapping.publicPort == ranked.front() && mapping.type == "tcp") {
      task.host = resolveProbeHost(mapping, endpoint);
      break;
    }
  }
  return task;
}
}  // namespace ld
