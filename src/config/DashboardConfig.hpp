#ifndef __LD_DASHBOARD_CONFIG__
#define __LD_DASHBOARD_CONFIG__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Process-wide settings, filled from defaults, then the INI file,
 * then the command line.
 */
struct DashboardConfig {
  int dashboardPort = DEFAULT_DASHBOARD_PORT;
  int terminalPort = DEFAULT_TERMINAL_PORT;
  string bindIp = "0.0.0.0";

  /** @brief Server registry file; empty means the platform default. */
  string registryPath;

  int connectTimeout = RUNTIME_CONNECT_TIMEOUT;
  int execTimeout = RUNTIME_EXEC_TIMEOUT;

  int reachabilityTtl = 30;
  int probeWorkers = 10;
  int maxPendingProbes = 256;
  double probeTimeout = 0.45;

  int verbose = 0;
  bool silent = false;
  string maxlogsize = "20971520";
  string logDir;

  /** @brief The registry path to use when none was configured. */
  static string defaultRegistryPath();
};

/**
 * @brief Reads `[Networking] [Storage] [Runtime] [Reachability] [Debug]`
 * from an INI file into `config`. Keys that are absent keep their value.
 * @return false when the file cannot be loaded.
 * @throws std::invalid_argument when a numeric value cannot be parsed.
 */
bool loadConfigFile(const string &filename, DashboardConfig *config);
}  // namespace ld

#endif  // __LD_DASHBOARD_CONFIG__
