#ifndef __LD_PORT_RANKING__
#define __LD_PORT_RANKING__

#include "Headers.hpp"

namespace ld {
/** @brief Ports most likely to serve HTTP, tried first and in this order. */
const vector<int> PREFERRED_HTTP_PORTS = {80, 443, 8080, 8000, 3000};

/** @brief At most this many ports are probed per container. */
const size_t MAX_PROBE_CANDIDATES = 6;

/**
 * @brief Orders candidate ports for probing: preferred ports in their list
 * order, then the rest ascending. Duplicates and out of range ports are
 * dropped and the result is capped at `limit`.
 */
vector<int> rankCandidatePorts(const vector<int> &ports,
                               size_t limit = MAX_PROBE_CANDIDATES);

/** @brief `http://host:port/`, with IPv6 literals bracketed. */
string formatProbeUrl(const string &host, int port);
}  // namespace ld

#endif  // __LD_PORT_RANKING__
