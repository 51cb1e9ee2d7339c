#ifndef __LD_DOCKER_ENGINE_CLIENT__
#define __LD_DOCKER_ENGINE_CLIENT__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RuntimeClient.hpp"

namespace ld {
class DockerEngineClient;

/**
 * @brief A container on a Docker Engine, backed by its inspect document.
 */
class DockerContainer : public ContainerHandle {
 public:
  DockerContainer(shared_ptr<DockerEngineClient> _client, const json &_attrs);

  const string &getId() const override { return id; }
  string getName() const override;

  void reload() override;
  ExecResult exec(const string &command, const string &workdir,
                  bool captureStdout, bool captureStderr) override;
  void start() override;
  void stop() override;
  void restart() override;
  void remove(bool force) override;
  string logs(int tail, bool timestamps) override;
  json attrs() const override;
  vector<PortMapping> getPorts() const override;

  /**
   * @brief Reads `NetworkSettings.Ports` of an inspect document.
   */
  static vector<PortMapping> parseInspectPorts(const json &inspect);

 protected:
  shared_ptr<DockerEngineClient> client;
  string id;
  json inspectData;
  mutable recursive_mutex attrsMutex;
};

/**
 * @brief Talks to the Docker Engine HTTP API over a unix socket or TCP.
 *
 * A fresh HTTP connection is opened per request so that a long exec in one
 * terminal session never waits on another session's request.
 */
class DockerEngineClient
    : public RuntimeClient,
      public std::enable_shared_from_this<DockerEngineClient> {
 public:
  DockerEngineClient(const RuntimeEndpoint &_endpoint, int _connectTimeout,
                     int _execTimeout);

  void ping() override;
  vector<ContainerSummary> list(bool all) override;
  shared_ptr<ContainerHandle> get(const string &id) override;
  const RuntimeEndpoint &getEndpoint() const override { return endpoint; }

  json inspect(const string &id);
  ExecResult exec(const string &id, const vector<string> &argv,
                  const string &workdir, bool captureStdout,
                  bool captureStderr);
  void containerAction(const string &id, const string &action);
  void removeContainer(const string &id, bool force);
  string logs(const string &id, int tail, bool timestamps, bool tty);

  /** @brief Parses a `GET /containers/json` document. */
  static vector<ContainerSummary> parseContainerList(const json &document);

  /** @brief Percent-encodes a value for use as one URL path segment. */
  static string encodePathSegment(const string &segment);

 protected:
  unique_ptr<httplib::Client> newHttpClient(int readTimeout);
  json checkJson(const httplib::Result &result, const string &what);
  void check(const httplib::Result &result, const string &what);

  RuntimeEndpoint endpoint;
  int connectTimeout;
  int execTimeout;
};

class DockerEngineClientFactory : public RuntimeClientFactory {
 public:
  DockerEngineClientFactory(int _connectTimeout = RUNTIME_CONNECT_TIMEOUT,
                            int _execTimeout = RUNTIME_EXEC_TIMEOUT)
      : connectTimeout(_connectTimeout), execTimeout(_execTimeout) {}

  shared_ptr<RuntimeClient> create(const RuntimeEndpoint &endpoint) override {
    return shared_ptr<RuntimeClient>(
        new DockerEngineClient(endpoint, connectTimeout, execTimeout));
  }

 protected:
  int connectTimeout;
  int execTimeout;
};
}  // namespace ld

#endif  // __LD_DOCKER_ENGINE_CLIENT__
