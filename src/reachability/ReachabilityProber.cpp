#include "ReachabilityProber.hpp"

#include "PortRanking.hpp"

namespace ld {
ReachabilityProber::ReachabilityProber(shared_ptr<ReachabilityCache> _cache,
                                       shared_ptr<HttpProber> _prober,
                                       int workers, size_t _maxPending,
                                       double _probeTimeout)
    : cache(_cache),
      prober(_prober),
      maxPending(_maxPending),
      probeTimeout(_probeTimeout),
      workerPool(new ThreadPool(workers > 0 ? workers : 1)),
      shuttingDown(false) {}

ReachabilityProber::~ReachabilityProber() { shutdown(); }

bool ReachabilityProber::scheduleProbe(const string &containerId,
                                       const string &host,
                                       const vector<int> &candidatePorts) {
  auto ranked = rankCandidatePorts(candidatePorts);
  double timeout = probeTimeout;
  return enqueue(containerId, [this, containerId, host, ranked, timeout]() {
    cache->record(containerId, runProbe(host, ranked, timeout));
  });
}

bool ReachabilityProber::scheduleDiscovery(const string &containerId,
                                           TaskResolver resolver) {
  double timeout = probeTimeout;
  return enqueue(containerId, [this, containerId, resolver, timeout]() {
    optional<ProbeTask> task;
    try {
      task = resolver();
    } catch (const std::exception &e) {
      LOG(INFO) << "Cannot discover ports of " << containerId << ": "
                << e.what();
    }
    if (!task) {
      cache->record(containerId, nullopt);
      return;
    }
    auto result = runProbe(task->host, task->candidatePorts, timeout);
    cache->record(containerId, result);
    // A name or short id also fills the entry the container list reads
    if (!task->containerId.empty() && task->containerId != containerId) {
      cache->record(task->containerId, result);
    }
  });
}

bool ReachabilityProber::enqueue(const string &containerId,
                                 function<void()> work) {
  {
    lock_guard<recursive_mutex> guard(proberMutex);
    if (shuttingDown || !workerPool) {
      VLOG(1) << "Prober is shutting down, dropping probe of " << containerId;
      return false;
    }
    if (inFlight.count(containerId)) {
      VLOG(2) << "Probe of " << containerId << " already in flight";
      return false;
    }
    if (inFlight.size() >= maxPending) {
      VLOG(1) << "Probe queue full, dropping probe of " << containerId;
      return false;
    }
    inFlight.insert(containerId);

    try {
      workerPool->enqueue([this, containerId, work]() {
        el::Helpers::setThreadName("reachability-probe");
        try {
          work();
        } catch (const std::exception &e) {
          LOG(INFO) << "Probe of " << containerId << " failed: " << e.what();
        }
        finish(containerId);
      });
    } catch (const std::runtime_error &e) {
      // ThreadPool refuses work once it is stopping
      inFlight.erase(containerId);
      LOG(INFO) << "Worker pool rejected probe of " << containerId << ": "
                << e.what();
      return false;
    }
  }
  return true;
}

void ReachabilityProber::finish(const string &containerId) {
  lock_guard<recursive_mutex> guard(proberMutex);
  inFlight.erase(containerId);
}

optional<string> ReachabilityProber::runProbe(const string &host,
                                              const vector<int> &ports,
                                              double timeoutSeconds) {
  for (int port : ports) {
    auto outcome = prober->probe(host, port, timeoutSeconds);
    if (outcome == ProbeOutcome::REACHABLE) {
      return formatProbeUrl(host, port);
    }
    VLOG(2) << host << ":" << port << " is not reachable";
  }
  return nullopt;
}

optional<string> ReachabilityProber::probeNow(
    const string &host, const vector<int> &ports, double timeoutSeconds,
    const optional<string> &containerId) {
  auto result = runProbe(host, rankCandidatePorts(ports), timeoutSeconds);
  if (containerId) {
    cache->record(*containerId, result);
  }
  return result;
}

void ReachabilityProber::shutdown() {
  unique_ptr<ThreadPool> pool;
  {
    lock_guard<recursive_mutex> guard(proberMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
    pool = std::move(workerPool);
  }
  // Joining outside the lock lets running probes call finish()
  pool.reset();
  LOG(INFO) << "Reachability prober stopped";
}

size_t ReachabilityProber::getPendingCount() {
  lock_guard<recursive_mutex> guard(proberMutex);
  return inFlight.size();
}
}  // namespace ld
