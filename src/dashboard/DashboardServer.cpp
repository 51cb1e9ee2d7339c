#include "DashboardServer.hpp"

#include "BatchActions.hpp"
#include "OutputDecoder.hpp"
#include "ProbeTargets.hpp"

namespace ld {
namespace {
const int DEFAULT_LOG_TAIL = 1000;
const double MIN_PROBE_TIMEOUT = 0.05;
const double MAX_PROBE_TIMEOUT = 10.0;

json parseBody(const httplib::Request &req) {
  auto body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  return body;
}

string stringField(const json &body, const char *key) {
  if (!body.contains(key) || body[key].is_null()) {
    return "";
  }
  if (body[key].is_string()) {
    return body[key].get<string>();
  }
  if (body[key].is_number_integer()) {
    return to_string(body[key].get<int64_t>());
  }
  throw std::invalid_argument(string(key) + " must be a string");
}
}  // namespace

DashboardServer::DashboardServer(
    shared_ptr<ServerRegistry> _registry,
    shared_ptr<ConnectionCache> _connectionCache,
    shared_ptr<ReachabilityCache> _reachabilityCache,
    shared_ptr<ReachabilityProber> _prober)
    : registry(_registry),
      connectionCache(_connectionCache),
      reachabilityCache(_reachabilityCache),
      prober(_prober) {
  registerRoutes();
}

void DashboardServer::registerRoutes() {
  using namespace std::placeholders;
  server.Get("/api/containers",
             bind(&DashboardServer::listContainers, this, _1, _2));
  server.Get(R"(/api/containers/([A-Za-z0-9_.-]+))",
             bind(&DashboardServer::inspectContainer, this, _1, _2));
  server.Get(R"(/api/containers/([A-Za-z0-9_.-]+)/logs)",
             bind(&DashboardServer::containerLogs, this, _1, _2));
  server.Post("/api/containers/action",
              bind(&DashboardServer::containerAction, this, _1, _2));
  server.Get("/api/servers", bind(&DashboardServer::listServers, this, _1, _2));
  server.Post("/api/servers", bind(&DashboardServer::addServer, this, _1, _2));
  server.Post(R"(/api/servers/(\d{1,9})/select)",
              bind(&DashboardServer::selectServer, this, _1, _2));
  server.Delete(R"(/api/servers/(\d{1,9}))",
                bind(&DashboardServer::deleteServer, this, _1, _2));
  server.Get(R"(/api/reachable/([A-Za-z0-9_.-]+))",
             bind(&DashboardServer::reachableLookup, this, _1, _2));
  server.Post("/api/reachable/probe",
              bind(&DashboardServer::reachableProbe, this, _1, _2));
  server.Get("/api/about",
             [](const httplib::Request &, httplib::Response &res) {
               sendJson(res, 200,
                        {{"name", "LightDock"}, {"version", LD_VERSION}});
             });
}

bool DashboardServer::listen(const string &host, int port) {
  LOG(INFO) << "Dashboard listening on " << host << ":" << port;
  return server.listen(host.c_str(), port);
}

int DashboardServer::bindToAnyPort(const string &host) {
  return server.bind_to_any_port(host.c_str());
}

bool DashboardServer::listenAfterBind() { return server.listen_after_bind(); }

void DashboardServer::stop() { server.stop(); }

bool DashboardServer::isRunning() { return server.is_running(); }

void DashboardServer::sendJson(httplib::Response &res, int status,
                               const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void DashboardServer::sendError(httplib::Response &res, int status,
                                const string &message) {
  sendJson(res, status, {{"error", message}});
}

void DashboardServer::withRuntime(httplib::Response &res,
                                  function<void()> handler) {
  try {
    handler();
  } catch (const ConnectionError &ce) {
    sendError(res, 503, ce.what());
  } catch (const NotFoundError &nfe) {
    sendError(res, 404, nfe.what());
  } catch (const ApiError &ae) {
    sendError(res, 502, string("Docker API Error: ") + ae.what());
  } catch (const std::invalid_argument &ia) {
    sendError(res, 400, ia.what());
  } catch (const std::exception &e) {
    LOG(ERROR) << "Unhandled error in dashboard handler: " << e.what();
    sendError(res, 500, e.what());
  }
}

json DashboardServer::containerToJson(const ContainerSummary &summary) {
  json ports = json::array();
  for (const auto &port : summary.ports) {
    ports.push_back({{"ip", port.ip},
                     {"privatePort", port.privatePort},
                     {"publicPort", port.publicPort},
                     {"type", port.type}});
  }
  return {{"id", summary.id},
          {"shortId", summary.id.substr(0, 12)},
          {"name", summary.name},
          {"image", summary.image},
          {"status", summary.status},
          {"state", summary.state},
          {"ports", ports}};
}

json DashboardServer::serverToJson(const ServerRecord &record) {
  return {{"id", record.id()},
          {"displayName", record.display_name()},
          {"host", record.host()},
          {"port", record.port()},
          {"user", record.user()},
          {"active", record.active()},
          {"label", ServerRegistry::describe(record)},
          {"endpoint", ServerRegistry::endpointFor(record).getUrl()}};
}

json DashboardServer::reachabilityFor(const ContainerSummary &summary,
                                      const RuntimeEndpoint &endpoint) {
  string url;
  switch (reachabilityCache->lookupState(summary.id, &url)) {
    case ReachabilityState::REACHABLE:
      return url;
    case ReachabilityState::UNREACHABLE:
      return nullptr;
    case ReachabilityState::UNKNOWN:
      break;
  }
  auto task = buildProbeTask(summary.id, summary.ports, endpoint);
  if (!task) {
    // Nothing published, no need to touch the network
    reachabilityCache->record(summary.id, nullopt);
  } else {
    prober->scheduleProbe(summary.id, task->host, task->candidatePorts);
  }
  return nullptr;
}

void DashboardServer::listContainers(const httplib::Request &req,
                                     httplib::Response &res) {
  withRuntime(res, [&]() {
    auto active = connectionCache->getActiveClient(*registry);
    const auto &endpoint = active.client->getEndpoint();
    json containers = json::array();
    for (const auto &summary : active.client->list(true)) {
      json entry = containerToJson(summary);
      entry["reachable"] = reachabilityFor(summary, endpoint);
      containers.push_back(entry);
    }
    string serverName = active.record
                            ? ServerRegistry::describe(*active.record)
                            : string("Local");
    sendJson(res, 200,
             {{"server", serverName},
              {"endpoint", endpoint.getUrl()},
              {"containers", containers}});
  });
}

void DashboardServer::inspectContainer(const httplib::Request &req,
                                       httplib::Response &res) {
  string id = req.matches[1];
  withRuntime(res, [&]() {
    auto active = connectionCache->getActiveClient(*registry);
    auto container = active.client->get(id);
    auto url = reachabilityCache->lookup(container->getId());
    sendJson(res, 200,
             {{"id", container->getId()},
              {"name", container->getName()},
              {"reachable", url ? json(*url) : json(nullptr)},
              {"attrs", container->attrs()}});
  });
}

void DashboardServer::containerLogs(const httplib::Request &req,
                                    httplib::Response &res) {
  string id = req.matches[1];
  withRuntime(res, [&]() {
    int tail = DEFAULT_LOG_TAIL;
    if (req.has_param("tail")) {
      try {
        tail = stoi(req.get_param_value("tail"));
      } catch (const std::logic_error &) {
        throw std::invalid_argument("tail must be an integer");
      }
      if (tail <= 0) {
        throw std::invalid_argument("tail must be positive");
      }
    }
    auto active = connectionCache->getActiveClient(*registry);
    auto container = active.client->get(id);
    sendJson(res, 200,
             {{"id", container->getId()},
              {"name", container->getName()},
              {"logs", decodeOutput(container->logs(tail, true),
                                    EMPTY_LOGS_PLACEHOLDER)}});
  });
}

void DashboardServer::containerAction(const httplib::Request &req,
                                      httplib::Response &res) {
  withRuntime(res, [&]() {
    auto body = parseBody(req);
    auto action = BatchActions::parseAction(stringField(body, "action"));
    if (!action) {
      throw std::invalid_argument("Unknown action");
    }
    vector<string> ids;
    if (body.contains("ids") && body["ids"].is_array()) {
      for (const auto &id : body["ids"]) {
        if (id.is_string() && !id.get<string>().empty()) {
          ids.push_back(id.get<string>());
        }
      }
    }
    if (ids.empty()) {
      throw std::invalid_argument("No containers selected");
    }
    auto active = connectionCache->getActiveClient(*registry);
    auto result = BatchActions::run(*active.client, *action, ids);
    sendJson(res, 200,
             {{"succeeded", result.succeeded},
              {"verb", result.verb},
              {"message", BatchActions::summarize(result)},
              {"errors", result.errors}});
  });
}

void DashboardServer::listServers(const httplib::Request &req,
                                  httplib::Response &res) {
  json servers = json::array();
  for (const auto &record : registry->list()) {
    servers.push_back(serverToJson(record));
  }
  auto active = registry->getActive();
  sendJson(res, 200,
           {{"servers", servers},
            {"active", active ? json(active->id()) : json(nullptr)},
            {"endpoint", registry->getActiveEndpoint().getUrl()}});
}

void DashboardServer::addServer(const httplib::Request &req,
                                httplib::Response &res) {
  withRuntime(res, [&]() {
    auto body = parseBody(req);
    auto record = registry->add(
        stringField(body, "displayName"), stringField(body, "host"),
        stringField(body, "port"), stringField(body, "user"),
        stringField(body, "password"));
    sendJson(res, 201, serverToJson(record));
  });
}

void DashboardServer::selectServer(const httplib::Request &req,
                                   httplib::Response &res) {
  int id = stoi(req.matches[1]);
  auto record = registry->setActive(id);
  if (!record) {
    sendError(res, 404, "Server " + to_string(id) + " not found");
    return;
  }
  sendJson(res, 200, {{"active", serverToJson(*record)}});
}

void DashboardServer::deleteServer(const httplib::Request &req,
                                   httplib::Response &res) {
  int id = stoi(req.matches[1]);
  auto record = registry->remove(id);
  if (!record) {
    sendError(res, 404, "Server " + to_string(id) + " not found");
    return;
  }
  auto active = registry->getActive();
  sendJson(res, 200,
           {{"deleted", serverToJson(*record)},
            {"active", active ? json(active->id()) : json(nullptr)}});
}

void DashboardServer::reachableLookup(const httplib::Request &req,
                                      httplib::Response &res) {
  string id = req.matches[1];
  string url;
  auto state = reachabilityCache->lookupState(id, &url);
  if (state == ReachabilityState::REACHABLE) {
    sendJson(res, 200, {{"reachable", url}, {"cached", true}});
    return;
  }
  if (state == ReachabilityState::UNREACHABLE) {
    sendJson(res, 200, {{"reachable", nullptr}, {"cached", true}});
    return;
  }

  auto registryRef = registry;
  auto connectionCacheRef = connectionCache;
  bool scheduled = prober->scheduleDiscovery(
      id, [registryRef, connectionCacheRef, id]() -> optional<ProbeTask> {
        auto active = connectionCacheRef->getActiveClient(*registryRef);
        auto container = active.client->get(id);
        return buildProbeTask(container->getId(), container->getPorts(),
                              active.client->getEndpoint());
      });
  sendJson(res, 200, {{"reachable", nullptr},
                      {"cached", false},
                      {"scheduled", scheduled}});
}

void DashboardServer::reachableProbe(const httplib::Request &req,
                                     httplib::Response &res) {
  withRuntime(res, [&]() {
    auto body = parseBody(req);
    if (!body.contains("host") || !body["host"].is_string() ||
        body["host"].get<string>().empty()) {
      throw std::invalid_argument("host is required");
    }
    if (!body.contains("ports") || !body["ports"].is_array()) {
      throw std::invalid_argument("ports is required");
    }
    vector<int> ports;
    for (const auto &port : body["ports"]) {
      if (!port.is_number_integer()) {
        throw std::invalid_argument("ports must be integers");
      }
      ports.push_back(port.get<int>());
    }
    double timeout = prober->getProbeTimeout();
    if (body.contains("timeout") && body["timeout"].is_number()) {
      timeout = min(MAX_PROBE_TIMEOUT,
                    max(MIN_PROBE_TIMEOUT, body["timeout"].get<double>()));
    }
    optional<string> containerId;
    if (body.contains("id") && body["id"].is_string()) {
      containerId = body["id"].get<string>();
    }

    auto url = prober->probeNow(body["host"].get<string>(), ports, timeout,
                                containerId);
    if (!url) {
      sendJson(res, 404, {{"reachable", nullptr}});
      return;
    }
    sendJson(res, 200, {{"reachable", *url}});
  });
}
}  // namespace ld
