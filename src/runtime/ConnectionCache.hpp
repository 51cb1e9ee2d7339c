#ifndef __LD_CONNECTION_CACHE__
#define __LD_CONNECTION_CACHE__

#include "Headers.hpp"
#include "RuntimeClient.hpp"
#include "ServerRegistry.hpp"

namespace ld {
struct ActiveClient {
  shared_ptr<RuntimeClient> client;
  /** @brief Absent when the local socket default is in use. */
  optional<ServerRecord> record;
};

/**
 * @brief Keeps one live runtime client per endpoint so requests do not
 * re-handshake. Entries that fail a liveness check are replaced.
 */
class ConnectionCache {
 public:
  explicit ConnectionCache(shared_ptr<RuntimeClientFactory> _factory);

  /**
   * @brief Returns a live client for `endpoint`.
   * @throws ConnectionError when the runtime cannot be reached. Nothing is
   * cached in that case.
   */
  shared_ptr<RuntimeClient> getClient(const RuntimeEndpoint& endpoint,
                                      bool useCache = true);

  /**
   * @brief Returns a live client for the registry's active endpoint.
   */
  ActiveClient getActiveClient(const ServerRegistry& registry,
                               bool useCache = true);

  /** @brief Drops every cached client. */
  void clear();

  size_t size();

 protected:
  shared_ptr<RuntimeClient> connect(const RuntimeEndpoint& endpoint);

  shared_ptr<RuntimeClientFactory> factory;
  unordered_map<string, shared_ptr<RuntimeClient>> clients;
  mutex cacheMutex;
};
}  // namespace ld

#endif  // __LD_CONNECTION_CACHE__
