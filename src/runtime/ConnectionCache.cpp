#include "ConnectionCache.hpp"

namespace ld {
ConnectionCache::ConnectionCache(shared_ptr<RuntimeClientFactory> _factory)
    : factory(_factory) {}

shared_ptr<RuntimeClient> ConnectionCache::getClient(
    const RuntimeEndpoint& endpoint, bool useCache) {
  const string key = endpoint.getUrl();
  if (useCache) {
    shared_ptr<RuntimeClient> cached;
    {
      lock_guard<mutex> guard(cacheMutex);
      auto it = clients.find(key);
      if (it != clients.end()) {
        cached = it->second;
      }
    }
    // The ping runs unlocked so a slow endpoint does not stall other callers
    if (cached) {
      try {
        cached->ping();
        return cached;
      } catch (const ApiError& e) {
        LOG(WARNING) << "Cached client for " << key
                     << " failed liveness check: " << e.what();
        lock_guard<mutex> guard(cacheMutex);
        auto it = clients.find(key);
        if (it != clients.end() && it->second == cached) {
          clients.erase(it);
        }
      }
    }
  }

  auto client = connect(endpoint);
  if (useCache) {
    lock_guard<mutex> guard(cacheMutex);
    clients[key] = client;
  }
  return client;
}

shared_ptr<RuntimeClient> ConnectionCache::connect(
    const RuntimeEndpoint& endpoint) {
  shared_ptr<RuntimeClient> client;
  try {
    client = factory->create(endpoint);
    client->ping();
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Cannot connect to " << endpoint << ": " << e.what();
    throw ConnectionError(endpoint.getUrl(), e.what());
  }
  LOG(INFO) << "Connected to runtime at " << endpoint;
  return client;
}

ActiveClient ConnectionCache::getActiveClient(const ServerRegistry& registry,
                                              bool useCache) {
  ActiveClient active;
  active.record = registry.getActive();
  RuntimeEndpoint endpoint = active.record
                                 ? ServerRegistry::endpointFor(*active.record)
                                 : RuntimeEndpoint();
  active.client = getClient(endpoint, useCache);
  return active;
}

void ConnectionCache::clear() {
  lock_guard<mutex> guard(cacheMutex);
  if (!clients.empty()) {
    LOG(INFO) << "Clearing " << clients.size() << " cached runtime clients";
  }
  clients.clear();
}

size_t ConnectionCache::size() {
  lock_guard<mutex> guard(cacheMutex);
  return clients.size();
}
}  // namespace ld
