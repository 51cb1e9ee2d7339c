#include "DockerEngineClient.hpp"

#include "CommandSplit.hpp"
#include "DockerStream.hpp"

namespace ld {
namespace {
const char *API_PREFIX = "/v1.41";

string errorMessageFromBody(const string &body, int status) {
  auto document = json::parse(body, nullptr, false);
  if (!document.is_discarded() && document.is_object() &&
      document.contains("message") && document["message"].is_string()) {
    return document["message"].get<string>();
  }
  if (!body.empty()) {
    return trim(body);
  }
  return string("HTTP ") + to_string(status) + " " +
         httplib::status_message(status);
}

// Shape errors surface as ApiError rather than nlohmann::json::type_error
void requireObject(const json &document, const string &what) {
  if (!document.is_object()) {
    throw ApiError(200, what + " returned " + document.type_name() +
                            " instead of an object");
  }
}

string stringField(const json &object, const char *key,
                   const string &fallback = string()) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<string>();
}

int intField(const json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) {
    return 0;
  }
  return it->get<int>();
}

string stripLeadingSlash(const string &name) {
  if (!name.empty() && name[0] == '/') {
    return name.substr(1);
  }
  return name;
}
}  // namespace

DockerContainer::DockerContainer(shared_ptr<DockerEngineClient> _client,
                                 const json &_attrs)
    : client(_client), inspectData(_attrs) {
  id = stringField(inspectData, "Id");
}

string DockerContainer::getName() const {
  lock_guard<recursive_mutex> guard(attrsMutex);
  return stripLeadingSlash(stringField(inspectData, "Name"));
}

void DockerContainer::reload() {
  auto fresh = client->inspect(id);
  lock_guard<recursive_mutex> guard(attrsMutex);
  inspectData = fresh;
}

ExecResult DockerContainer::exec(const string &command, const string &workdir,
                                 bool captureStdout, bool captureStderr) {
  auto argv = splitCommandLine(command);
  if (argv.empty()) {
    throw ApiError(400, "Empty command");
  }
  return client->exec(id, argv, workdir, captureStdout, captureStderr);
}

void DockerContainer::start() { client->containerAction(id, "start"); }

void DockerContainer::stop() { client->containerAction(id, "stop"); }

void DockerContainer::restart() { client->containerAction(id, "restart"); }

void DockerContainer::remove(bool force) { client->removeContainer(id, force); }

string DockerContainer::logs(int tail, bool timestamps) {
  bool tty = false;
  {
    lock_guard<recursive_mutex> guard(attrsMutex);
    if (inspectData.contains("Config") && inspectData["Config"].is_object()) {
      auto flag = inspectData["Config"].find("Tty");
      tty = flag != inspectData["Config"].end() && flag->is_boolean() &&
            flag->get<bool>();
    }
  }
  return client->logs(id, tail, timestamps, tty);
}

json DockerContainer::attrs() const {
  lock_guard<recursive_mutex> guard(attrsMutex);
  return inspectData;
}

vector<PortMapping> DockerContainer::getPorts() const {
  lock_guard<recursive_mutex> guard(attrsMutex);
  return parseInspectPorts(inspectData);
}

vector<PortMapping> DockerContainer::parseInspectPorts(const json &inspect) {
  vector<PortMapping> ports;
  if (!inspect.contains("NetworkSettings") ||
      !inspect["NetworkSettings"].is_object()) {
    return ports;
  }
  const json &settings = inspect["NetworkSettings"];
  if (!settings.contains("Ports") || !settings["Ports"].is_object()) {
    return ports;
  }
  // Keys look like "80/tcp", values are null or a list of host bindings
  for (auto &it : settings["Ports"].items()) {
    auto tokens = split(it.key(), '/');
    if (tokens.empty()) {
      continue;
    }
    PortMapping base;
    try {
      base.privatePort = stoi(tokens[0]);
    } catch (const std::logic_error &) {
      LOG(WARNING) << "Ignoring malformed port key: " << it.key();
      continue;
    }
    if (tokens.size() > 1) {
      base.type = tokens[1];
    }
    if (!it.value().is_array() || it.value().empty()) {
      ports.push_back(base);
      continue;
    }
    for (auto &binding : it.value()) {
      if (!binding.is_object()) {
        continue;
      }
      PortMapping mapping = base;
      mapping.ip = stringField(binding, "HostIp");
      auto hostPort = stringField(binding, "HostPort");
      try {
        mapping.publicPort = hostPort.empty() ? 0 : stoi(hostPort);
      } catch (const std::logic_error &) {
        mapping.publicPort = 0;
      }
      ports.push_back(mapping);
    }
  }
  return ports;
}

DockerEngineClient::DockerEngineClient(const RuntimeEndpoint &_endpoint,
                                       int _connectTimeout, int _execTimeout)
    : endpoint(_endpoint),
      connectTimeout(_connectTimeout),
      execTimeout(_execTimeout) {}

unique_ptr<httplib::Client> DockerEngineClient::newHttpClient(
    int readTimeout) {
  unique_ptr<httplib::Client> httpClient;
  if (endpoint.isLocal()) {
    httpClient.reset(new httplib::Client(endpoint.getSocketPath()));
    httpClient->set_address_family(AF_UNIX);
    httpClient->set_default_headers({{"Host", "docker"}});
  } else {
    httpClient.reset(
        new httplib::Client(endpoint.getHost(), endpoint.getPort()));
  }
  httpClient->set_connection_timeout(connectTimeout, 0);
  httpClient->set_read_timeout(readTimeout, 0);
  httpClient->set_write_timeout(connectTimeout, 0);
  httpClient->set_keep_alive(false);
  return httpClient;
}

void DockerEngineClient::check(const httplib::Result &result,
                               const string &what) {
  if (!result) {
    throw ApiError(0, what + " failed: " + httplib::to_string(result.error()));
  }
  int status = result->status;
  if (status == 404) {
    throw NotFoundError(errorMessageFromBody(result->body, status));
  }
  if (status >= 400) {
    throw ApiError(status, to_string(status) + " " +
                               httplib::status_message(status) + ": " +
                               errorMessageFromBody(result->body, status));
  }
}

json DockerEngineClient::checkJson(const httplib::Result &result,
                                   const string &what) {
  check(result, what);
  auto document = json::parse(result->body, nullptr, false);
  if (document.is_discarded()) {
    throw ApiError(result->status, what + " returned malformed JSON");
  }
  return document;
}

void DockerEngineClient::ping() {
  auto httpClient = newHttpClient(connectTimeout);
  auto result = httpClient->Get(string(API_PREFIX) + "/_ping");
  check(result, "ping " + endpoint.getUrl());
}

vector<ContainerSummary> DockerEngineClient::list(bool all) {
  auto httpClient = newHttpClient(connectTimeout);
  auto document = checkJson(
      httpClient->Get(string(API_PREFIX) + "/containers/json?all=" +
                      (all ? "1" : "0")),
      "list containers");
  return parseContainerList(document);
}

vector<ContainerSummary> DockerEngineClient::parseContainerList(
    const json &document) {
  vector<ContainerSummary> containers;
  if (!document.is_array()) {
    throw ApiError(200, "Container list is not an array");
  }
  for (auto &entry : document) {
    if (!entry.is_object()) {
      LOG(WARNING) << "Ignoring malformed container list entry";
      continue;
    }
    ContainerSummary summary;
    summary.id = stringField(entry, "Id");
    if (entry.contains("Names") && entry["Names"].is_array() &&
        !entry["Names"].empty() && entry["Names"][0].is_string()) {
      summary.name = stripLeadingSlash(entry["Names"][0].get<string>());
    }
    summary.image = stringField(entry, "Image");
    summary.status = stringField(entry, "Status");
    summary.state = stringField(entry, "State");
    if (entry.contains("Ports") && entry["Ports"].is_array()) {
      for (auto &port : entry["Ports"]) {
        if (!port.is_object()) {
          continue;
        }
        PortMapping mapping;
        mapping.ip = stringField(port, "IP");
        mapping.privatePort = intField(port, "PrivatePort");
        mapping.publicPort = intField(port, "PublicPort");
        mapping.type = stringField(port, "Type", "tcp");
        summary.ports.push_back(mapping);
      }
    }
    containers.push_back(summary);
  }
  return containers;
}

json DockerEngineClient::inspect(const string &id) {
  auto httpClient = newHttpClient(connectTimeout);
  auto document = checkJson(httpClient->Get(string(API_PREFIX) +
                                            "/containers/" +
                                            encodePathSegment(id) + "/json"),
                            "inspect " + id);
  requireObject(document, "inspect " + id);
  if (!document.contains("Id") || !document["Id"].is_string()) {
    throw ApiError(200, "inspect " + id + " returned no container id");
  }
  return document;
}

shared_ptr<ContainerHandle> DockerEngineClient::get(const string &id) {
  auto document = inspect(id);
  return shared_ptr<ContainerHandle>(
      new DockerContainer(shared_from_this(), document));
}

ExecResult DockerEngineClient::exec(const string &id,
                                    const vector<string> &argv,
                                    const string &workdir, bool captureStdout,
                                    bool captureStderr) {
  json createRequest = {{"AttachStdin", false},
                        {"AttachStdout", captureStdout},
                        {"AttachStderr", captureStderr},
                        {"Tty", false},
                        {"Cmd", argv}};
  if (!workdir.empty()) {
    createRequest["WorkingDir"] = workdir;
  }
  string execId;
  {
    auto httpClient = newHttpClient(connectTimeout);
    auto created = checkJson(
        httpClient->Post(string(API_PREFIX) + "/containers/" +
                             encodePathSegment(id) + "/exec",
                         createRequest.dump(), "application/json"),
        "create exec in " + id);
    requireObject(created, "create exec in " + id);
    if (created.contains("Id") && created["Id"].is_string()) {
      execId = created["Id"].get<string>();
    }
    if (execId.empty()) {
      throw ApiError(201, "Exec create returned no id");
    }
  }

  ExecResult result;
  {
    json startRequest = {{"Detach", false}, {"Tty", false}};
    auto httpClient = newHttpClient(execTimeout);
    auto started = httpClient->Post(
        string(API_PREFIX) + "/exec/" + execId + "/start", startRequest.dump(),
        "application/json");
    if (!started && started.error() == httplib::Error::Read) {
      throw ApiError(0, "Command did not finish within " +
                            to_string(execTimeout) + " seconds");
    }
    check(started, "start exec in " + id);
    result.output =
        DockerStream::demultiplex(started->body, captureStdout, captureStderr);
  }

  {
    auto httpClient = newHttpClient(connectTimeout);
    auto state = checkJson(
        httpClient->Get(string(API_PREFIX) + "/exec/" + execId + "/json"),
        "inspect exec in " + id);
    if (state.contains("ExitCode") && state["ExitCode"].is_number_integer()) {
      result.exitCode = state["ExitCode"].get<int>();
    }
  }
  VLOG(1) << "exec in " << id << " exited with " << result.exitCode << " ("
          << result.output.size() << " bytes)";
  return result;
}

void DockerEngineClient::containerAction(const string &id,
                                         const string &action) {
  auto httpClient = newHttpClient(execTimeout);
  auto result = httpClient->Post(string(API_PREFIX) + "/containers/" +
                                     encodePathSegment(id) + "/" + action,
                                 "", "application/json");
  // 304 means the container is already in the requested state
  if (result && result->status == 304) {
    return;
  }
  check(result, action + " " + id);
}

void DockerEngineClient::removeContainer(const string &id, bool force) {
  auto httpClient = newHttpClient(execTimeout);
  check(httpClient->Delete(string(API_PREFIX) + "/containers/" +
                           encodePathSegment(id) +
                           (force ? "?force=1" : "?force=0")),
        "remove " + id);
}

string DockerEngineClient::logs(const string &id, int tail, bool timestamps,
                                bool tty) {
  auto httpClient = newHttpClient(execTimeout);
  auto result =
      httpClient->Get(string(API_PREFIX) + "/containers/" +
                      encodePathSegment(id) + "/logs?stdout=1&stderr=1&tail=" +
                      to_string(tail) + "&timestamps=" +
                      (timestamps ? "1" : "0"));
  check(result, "logs " + id);
  if (tty) {
    return result->body;
  }
  return DockerStream::demultiplex(result->body);
}

string DockerEngineClient::encodePathSegment(const string &segment) {
  static const char *hex = "0123456789ABCDEF";
  string out;
  for (unsigned char c : segment) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}
}  // namespace ld
