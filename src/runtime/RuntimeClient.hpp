#ifndef __LD_RUNTIME_CLIENT__
#define __LD_RUNTIME_CLIENT__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RuntimeEndpoint.hpp"

namespace ld {
/**
 * @brief The runtime behind an endpoint could not be reached.
 */
class ConnectionError : public std::runtime_error {
 public:
  ConnectionError(const string &_endpoint, const string &_cause)
      : std::runtime_error("Cannot connect to Docker at " + _endpoint + ": " +
                           _cause),
        endpoint(_endpoint),
        cause(_cause) {}

  const string &getEndpoint() const { return endpoint; }

  const string &getCause() const { return cause; }

 protected:
  string endpoint;
  string cause;
};

/**
 * @brief The runtime answered a request with an error, or the request failed
 * in transit. A status of 0 means no HTTP response was received.
 */
class ApiError : public std::runtime_error {
 public:
  ApiError(int _status, const string &message)
      : std::runtime_error(message), status(_status) {}

  int getStatus() const { return status; }

 protected:
  int status;
};

/** @brief The referenced container (or exec instance) does not exist. */
class NotFoundError : public ApiError {
 public:
  explicit NotFoundError(const string &message) : ApiError(404, message) {}
};

struct PortMapping {
  /** @brief Host address the port is published on, empty when unpublished. */
  string ip;
  int privatePort = 0;
  /** @brief Host-side port, 0 when the port is not published. */
  int publicPort = 0;
  string type = "tcp";
};

struct ContainerSummary {
  string id;
  string name;
  string image;
  /** @brief Human readable status, e.g. "Up 3 hours". */
  string status;
  /** @brief Machine state, e.g. "running" or "exited". */
  string state;
  vector<PortMapping> ports;
};

struct ExecResult {
  int exitCode = 0;
  /** @brief stdout and stderr interleaved in arrival order, raw bytes. */
  string output;
};

/**
 * @brief A single container on a runtime. Every call may throw
 * NotFoundError or ApiError.
 */
class ContainerHandle {
 public:
  virtual ~ContainerHandle() {}

  virtual const string &getId() const = 0;
  virtual string getName() const = 0;

  /** @brief Refreshes the cached inspect data from the runtime. */
  virtual void reload() = 0;

  /**
   * @brief Runs `command` inside the container in `workdir`.
   */
  virtual ExecResult exec(const string &command, const string &workdir,
                          bool captureStdout, bool captureStderr) = 0;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void restart() = 0;
  virtual void remove(bool force) = 0;

  /** @brief The last `tail` log lines as raw bytes. */
  virtual string logs(int tail, bool timestamps) = 0;

  /** @brief Inspect data as of the last reload. */
  virtual json attrs() const = 0;

  /** @brief Published and exposed ports as of the last reload. */
  virtual vector<PortMapping> getPorts() const = 0;
};

/**
 * @brief Client for one container runtime endpoint.
 */
class RuntimeClient {
 public:
  virtual ~RuntimeClient() {}

  /**
   * @brief Cheap liveness check.
   * @throws ApiError when the runtime does not answer.
   */
  virtual void ping() = 0;

  virtual vector<ContainerSummary> list(bool all) = 0;

  /**
   * @throws NotFoundError when no container has this id or name.
   */
  virtual shared_ptr<ContainerHandle> get(const string &id) = 0;

  virtual const RuntimeEndpoint &getEndpoint() const = 0;
};

/**
 * @brief Creates unconnected clients; the connection cache owns liveness.
 */
class RuntimeClientFactory {
 public:
  virtual ~RuntimeClientFactory() {}

  virtual shared_ptr<RuntimeClient> create(const RuntimeEndpoint &endpoint) = 0;
};
}  // namespace ld

#endif  // __LD_RUNTIME_CLIENT__
