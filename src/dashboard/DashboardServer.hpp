#ifndef __LD_DASHBOARD_SERVER__
#define __LD_DASHBOARD_SERVER__

#include "ConnectionCache.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "ReachabilityCache.hpp"
#include "ReachabilityProber.hpp"
#include "ServerRegistry.hpp"

namespace ld {
/**
 * @brief JSON API over HTTP for listing and managing containers, the server
 * registry and container reachability.
 *
 * Handlers run on httplib's worker threads and only share the registry and
 * the two caches, which are safe for concurrent use.
 */
class DashboardServer {
 public:
  DashboardServer(shared_ptr<ServerRegistry> _registry,
                  shared_ptr<ConnectionCache> _connectionCache,
                  shared_ptr<ReachabilityCache> _reachabilityCache,
                  shared_ptr<ReachabilityProber> _prober);

  /** @brief Binds and serves until stop(). */
  bool listen(const string &host, int port);

  /** @brief Binds an ephemeral port and returns it, or -1. */
  int bindToAnyPort(const string &host);

  /** @brief Serves on the port bound by bindToAnyPort until stop(). */
  bool listenAfterBind();

  void stop();

  bool isRunning();

 protected:
  void registerRoutes();

  void listContainers(const httplib::Request &req, httplib::Response &res);
  void inspectContainer(const httplib::Request &req, httplib::Response &res);
  void containerLogs(const httplib::Request &req, httplib::Response &res);
  void containerAction(const httplib::Request &req, httplib::Response &res);
  void listServers(const httplib::Request &req, httplib::Response &res);
  void addServer(const httplib::Request &req, httplib::Response &res);
  void selectServer(const httplib::Request &req, httplib::Response &res);
  void deleteServer(const httplib::Request &req, httplib::Response &res);
  /**
   * @brief Cache lookup keyed by the id as given. A miss schedules discovery,
   * which also records the result under the full container id.
   */
  void reachableLookup(const httplib::Request &req, httplib::Response &res);
  void reachableProbe(const httplib::Request &req, httplib::Response &res);

  /**
   * @brief Runs `handler`, turning runtime failures into JSON errors:
   * ConnectionError 503, NotFoundError 404, ApiError 502, anything else 500.
   */
  void withRuntime(httplib::Response &res, function<void()> handler);

  /**
   * @brief Returns the reachable URL from the fast path, scheduling a probe
   * on a miss.
   */
  json reachabilityFor(const ContainerSummary &summary,
                       const RuntimeEndpoint &endpoint);

  static json containerToJson(const ContainerSummary &summary);
  static json serverToJson(const ServerRecord &record);
  static void sendJson(httplib::Response &res, int status, const json &body);
  static void sendError(httplib::Response &res, int status,
                        const string &message);

  shared_ptr<ServerRegistry> registry;
  shared_ptr<ConnectionCache> connectionCache;
  shared_ptr<ReachabilityCache> reachabilityCache;
  shared_ptr<ReachabilityProber> prober;
  httplib::Server server;
};
}  // namespace ld

#endif  // __LD_DASHBOARD_SERVER__
