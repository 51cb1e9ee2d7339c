#ifndef __LD_SERVER_REGISTRY__
#define __LD_SERVER_REGISTRY__

#include "Headers.hpp"
#include "RuntimeEndpoint.hpp"

namespace ld {
/**
 * @brief The set of configured runtime endpoints, with at most one active.
 *
 * Records are persisted as a ServerRegistryState protobuf. An empty path
 * keeps the registry in memory only.
 */
class ServerRegistry {
 public:
  explicit ServerRegistry(const string& _path);

  vector<ServerRecord> list() const;

  optional<ServerRecord> get(int id) const;

  /**
   * @brief Validates and stores a new record. The first record added
   * becomes active.
   * @throws std::invalid_argument describing the first invalid field.
   */
  ServerRecord add(const string& displayName, const string& host,
                   const string& port, const string& user,
                   const string& password);

  /**
   * @brief Makes `id` the only active record.
   * @return The newly active record, or nullopt when `id` is unknown (the
   * registry is left unchanged).
   */
  optional<ServerRecord> setActive(int id);

  /**
   * @brief Deletes `id`. When it was active, the first remaining record
   * becomes active.
   * @return The removed record, or nullopt when `id` is unknown.
   */
  optional<ServerRecord> remove(int id);

  optional<ServerRecord> getActive() const;

  /**
   * @brief The endpoint of the active record, or the local socket when no
   * record is active or the active record has no host and port.
   */
  RuntimeEndpoint getActiveEndpoint() const;

  /** @brief Called after every successful mutation. */
  void addChangeListener(function<void()> listener);

  static bool hasRemoteAddress(const ServerRecord& record);

  static RuntimeEndpoint endpointFor(const ServerRecord& record);

  /** @brief "name (tcp://host:port)" or "name (local)". */
  static string describe(const ServerRecord& record);

 protected:
  void load();
  void save();
  void notifyChanged();

  string path;
  ServerRegistryState state;
  mutable recursive_mutex registryMutex;
  vector<function<void()>> changeListeners;
};
}  // namespace ld

#endif  // __LD_SERVER_REGISTRY__
