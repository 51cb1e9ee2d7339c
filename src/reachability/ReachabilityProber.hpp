#ifndef __LD_REACHABILITY_PROBER__
#define __LD_REACHABILITY_PROBER__

#include "Headers.hpp"
#include "HttpProber.hpp"
#include "ProbeTargets.hpp"
#include "ReachabilityCache.hpp"

namespace ld {
/**
 * @brief Runs reachability probes on a fixed worker pool and records the
 * results in a ReachabilityCache. Scheduling never blocks the caller.
 */
class ReachabilityProber {
 public:
  /** @brief Produces the probe for a container, or nullopt if none. */
  typedef function<optional<ProbeTask>()> TaskResolver;

  ReachabilityProber(shared_ptr<ReachabilityCache> _cache,
                     shared_ptr<HttpProber> _prober, int workers = 10,
                     size_t _maxPending = 256, double _probeTimeout = 0.45);

  ~ReachabilityProber();

  /**
   * @brief Queues a probe of `candidatePorts` (ranked here) on `host`.
   * @return false when the queue is full, the prober is shutting down, or a
   * probe for this container is already queued or running.
   */
  bool scheduleProbe(const string &containerId, const string &host,
                     const vector<int> &candidatePorts);

  /**
   * @brief Like scheduleProbe, but the target is discovered on the worker
   * by calling `resolver`. A resolver that throws or finds no ports records
   * the container as unreachable. When the task names a different
   * container id (the caller used a name or short id), the result is
   * recorded under both keys.
   */
  bool scheduleDiscovery(const string &containerId, TaskResolver resolver);

  /**
   * @brief Probes the ranked ports synchronously, each attempt bounded by
   * `timeoutSeconds`.
   * @param containerId When set, the result is recorded in the cache.
   * @return The first reachable URL.
   */
  optional<string> probeNow(const string &host, const vector<int> &ports,
                            double timeoutSeconds,
                            const optional<string> &containerId = nullopt);

  /**
   * @brief Stops accepting work and waits for queued probes to finish.
   */
  void shutdown();

  /** @brief Number of probes queued or running. */
  size_t getPendingCount();

  double getProbeTimeout() const { return probeTimeout; }

 protected:
  bool enqueue(const string &containerId, function<void()> work);
  optional<string> runProbe(const string &host, const vector<int> &ports,
                            double timeoutSeconds);
  void finish(const string &containerId);

  shared_ptr<ReachabilityCache> cache;
  shared_ptr<HttpProber> prober;
  size_t maxPending;
  double probeTimeout;
  unique_ptr<ThreadPool> workerPool;
  set<string> inFlight;
  bool shuttingDown;
  recursive_mutex proberMutex;
};
}  // namespace ld

#endif  // __LD_REACHABILITY_PROBER__
