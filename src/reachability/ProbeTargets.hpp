#ifndef __LD_PROBE_TARGETS__
#define __LD_PROBE_TARGETS__

#include "Headers.hpp"
#include "RuntimeClient.hpp"
#include "RuntimeEndpoint.hpp"

namespace ld {
struct ProbeTask {
  string containerId;
  string host;
  /** @brief Already ranked and capped. */
  vector<int> candidatePorts;
};

/**
 * @brief Where to reach a published port from the dashboard: the binding's
 * own address when it is specific, else the remote runtime host, else
 * loopback.
 */
string resolveProbeHost(const PortMapping &mapping,
                        const RuntimeEndpoint &endpoint);

/**
 * @brief Builds the probe for a container from its TCP port mappings.
 * @return nullopt when nothing is published on the host.
 */
optional<ProbeTask> buildProbeTask(const string &containerId,
                                   const vector<PortMapping> &ports,
                                   const RuntimeEndpoint &endpoint);
}  // namespace ld

#endif  // __LD_PROBE_TARGETS__
