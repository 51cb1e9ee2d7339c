#include "DashboardConfig.hpp"

#include "SimpleIni.h"

namespace ld {
namespace {
int readInt(CSimpleIniA &ini, const char *section, const char *key,
            int fallback) {
  const char *value = ini.GetValue(section, key, NULL);
  if (!value) {
    return fallback;
  }
  try {
    return stoi(value);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(string("Invalid integer for [") + section +
                                "] " + key + ": " + value);
  }
}

double readDouble(CSimpleIniA &ini, const char *section, const char *key,
                  double fallback) {
  const char *value = ini.GetValue(section, key, NULL);
  if (!value) {
    return fallback;
  }
  try {
    return stod(value);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(string("Invalid number for [") + section +
                                "] " + key + ": " + value);
  }
}
}  // namespace

string DashboardConfig::defaultRegistryPath() {
  return sago::getDataHome() + "/lightdock/servers.db";
}

bool loadConfigFile(const string &filename, DashboardConfig *config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc != 0) {
    return false;
  }

  config->dashboardPort =
      readInt(ini, "Networking", "port", config->dashboardPort);
  config->terminalPort =
      readInt(ini, "Networking", "terminal_port", config->terminalPort);
  const char *bindIp = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIp) {
    config->bindIp = bindIp;
  }

  const char *registry = ini.GetValue("Storage", "registry", NULL);
  if (registry) {
    config->registryPath = registry;
  }
  const char *logDir = ini.GetValue("Storage", "logdir", NULL);
  if (logDir) {
    config->logDir = logDir;
  }

  config->connectTimeout =
      readInt(ini, "Runtime", "connect_timeout", config->connectTimeout);
  config->execTimeout =
      readInt(ini, "Runtime", "exec_timeout", config->execTimeout);

  config->reachabilityTtl =
      readInt(ini, "Reachability", "ttl", config->reachabilityTtl);
  config->probeWorkers =
      readInt(ini, "Reachability", "workers", config->probeWorkers);
  config->maxPendingProbes =
      readInt(ini, "Reachability", "max_pending", config->maxPendingProbes);
  config->probeTimeout =
      readDouble(ini, "Reachability", "probe_timeout", config->probeTimeout);

  config->verbose = readInt(ini, "Debug", "verbose", config->verbose);
  config->silent = readInt(ini, "Debug", "silent", config->silent ? 1 : 0) != 0;
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxlogsize = string(logsize);
  }
  return true;
}
}  // namespace ld
