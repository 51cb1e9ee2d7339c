#include "ServerRegistry.hpp"

namespace ld {
namespace {
const size_t MAX_DISPLAY_NAME = 100;
const size_t MAX_HOST = 255;
const size_t MAX_PORT_DIGITS = 10;
const size_t MAX_USER = 100;
const size_t MAX_PASSWORD = 255;
}  // namespace

ServerRegistry::ServerRegistry(const string& _path) : path(_path) {
  if (!path.empty()) {
    load();
  }
}

void ServerRegistry::load() {
  if (!fs::exists(path)) {
    LOG(INFO) << "No server registry at " << path << ", starting empty";
    return;
  }
  ifstream in(path, ios::in | ios::binary);
  if (!in.good()) {
    throw std::runtime_error("Cannot open server registry " + path);
  }
  stringstream buffer;
  buffer << in.rdbuf();
  ServerRegistryState loaded;
  if (!loaded.ParseFromString(buffer.str())) {
    throw std::runtime_error("Corrupt server registry " + path);
  }
  state = loaded;
  LOG(INFO) << "Loaded " << state.servers_size() << " servers from " << path;
}

void ServerRegistry::save() {
  if (path.empty()) {
    return;
  }
  auto parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }
  string tmpPath = path + ".tmp";
  {
    ofstream out(tmpPath, ios::out | ios::binary | ios::trunc);
    out << protoToString(state);
    out.close();
    if (out.fail()) {
      throw std::runtime_error("Cannot write server registry " + tmpPath);
    }
  }
  fs::rename(tmpPath, path);
}

void ServerRegistry::notifyChanged() {
  vector<function<void()>> listeners;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    listeners = changeListeners;
  }
  for (auto& listener : listeners) {
    listener();
  }
}

void ServerRegistry::addChangeListener(function<void()> listener) {
  lock_guard<recursive_mutex> guard(registryMutex);
  changeListeners.push_back(listener);
}

vector<ServerRecord> ServerRegistry::list() const {
  lock_guard<recursive_mutex> guard(registryMutex);
  return vector<ServerRecord>(state.servers().begin(), state.servers().end());
}

optional<ServerRecord> ServerRegistry::get(int id) const {
  lock_guard<recursive_mutex> guard(registryMutex);
  for (const auto& record : state.servers()) {
    if (record.id() == id) {
      return record;
    }
  }
  return nullopt;
}

ServerRecord ServerRegistry::add(const string& displayName, const string& host,
                                 const string& port, const string& user,
                                 const string& password) {
  string name = trim(displayName);
  if (name.empty()) {
    throw std::invalid_argument("Server name is required");
  }
  if (name.size() > MAX_DISPLAY_NAME) {
    throw std::invalid_argument("Server name must be at most 100 characters");
  }
  if (host.size() > MAX_HOST) {
    throw std::invalid_argument("Host must be at most 255 characters");
  }
  if (port.size() > MAX_PORT_DIGITS ||
      !all_of(port.begin(), port.end(),
              [](char c) { return c >= '0' && c <= '9'; })) {
    throw std::invalid_argument("Port must contain only digits");
  }
  if (!port.empty() && stol(port) > 65535) {
    throw std::invalid_argument("Port must be at most 65535");
  }
  if (user.size() > MAX_USER) {
    throw std::invalid_argument("User must be at most 100 characters");
  }
  if (password.size() > MAX_PASSWORD) {
    throw std::invalid_argument("Password must be at most 255 characters");
  }

  ServerRecord added;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    added.set_id(state.next_id());
    added.set_display_name(name);
    added.set_host(trim(host));
    added.set_port(port);
    added.set_user(user);
    added.set_password(password);
    added.set_active(state.servers_size() == 0);
    state.set_next_id(state.next_id() + 1);
    *state.add_servers() = added;
    save();
  }
  LOG(INFO) << "Added server " << describe(added);
  notifyChanged();
  return added;
}

optional<ServerRecord> ServerRegistry::setActive(int id) {
  optional<ServerRecord> activated;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    if (!get(id)) {
      return nullopt;
    }
    for (auto& record : *state.mutable_servers()) {
      record.set_active(record.id() == id);
      if (record.id() == id) {
        activated = record;
      }
    }
    save();
  }
  LOG(INFO) << "Active server is now " << describe(*activated);
  notifyChanged();
  return activated;
}

optional<ServerRecord> ServerRegistry::remove(int id) {
  optional<ServerRecord> removed;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    auto servers = state.mutable_servers();
    for (int i = 0; i < servers->size(); i++) {
      if (servers->Get(i).id() == id) {
        removed = servers->Get(i);
        servers->DeleteSubrange(i, 1);
        break;
      }
    }
    if (!removed) {
      return nullopt;
    }
    if (removed->active() && servers->size() > 0) {
      servers->Mutable(0)->set_active(true);
    }
    save();
  }
  LOG(INFO) << "Removed server " << describe(*removed);
  notifyChanged();
  return removed;
}

optional<ServerRecord> ServerRegistry::getActive() const {
  lock_guard<recursive_mutex> guard(registryMutex);
  for (const auto& record : state.servers()) {
    if (record.active()) {
      return record;
    }
  }
  return nullopt;
}

RuntimeEndpoint ServerRegistry::getActiveEndpoint() const {
  auto active = getActive();
  if (!active) {
    return RuntimeEndpoint();
  }
  return endpointFor(*active);
}

bool ServerRegistry::hasRemoteAddress(const ServerRecord& record) {
  return !record.host().empty() && !record.port().empty();
}

RuntimeEndpoint ServerRegistry::endpointFor(const ServerRecord& record) {
  if (!hasRemoteAddress(record)) {
    return RuntimeEndpoint();
  }
  return RuntimeEndpoint::tcp(record.host(), stoi(record.port()));
}

string ServerRegistry::describe(const ServerRecord& record) {
  if (hasRemoteAddress(record)) {
    return record.display_name() + " (" + endpointFor(record).getUrl() + ")";
  }
  return record.display_name() + " (local)";
}
}  // namespace ld
