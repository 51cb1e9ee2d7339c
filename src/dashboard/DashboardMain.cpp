#include <cxxopts.hpp>

#include "DaemonCreator.hpp"
#include "DashboardConfig.hpp"
#include "DashboardServer.hpp"
#include "DockerEngineClient.hpp"
#include "HttpProber.hpp"
#include "LogHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "TerminalServer.hpp"

using namespace ld;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ld::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ld::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("lightdock",
                           "Container dashboard with in-browser terminals");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Dashboard API port",
         cxxopts::value<int>()->default_value("0"))  //
        ("terminalport", "Terminal WebSocket port",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("daemon", "Daemonize the dashboard")          //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/lightdock.pid"))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("registry", "Location of the server registry",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lightdock version " << LD_VERSION << endl;
      exit(0);
    }

    DashboardConfig config;
    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        if (!loadConfigFile(cfgfilename, &config)) {
          STFATAL << "Invalid config file: " << cfgfilename;
        }
      } catch (const std::invalid_argument &ia) {
        STFATAL << "Invalid config file " << cfgfilename << ": " << ia.what();
      }
    }

    // Command line values win over the config file
    if (result.count("port")) {
      config.dashboardPort = result["port"].as<int>();
    }
    if (result.count("terminalport")) {
      config.terminalPort = result["terminalport"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("registry")) {
      config.registryPath = result["registry"].as<string>();
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (config.registryPath.empty()) {
      config.registryPath = DashboardConfig::defaultRegistryPath();
    }
    if (config.logDir.empty()) {
      config.logDir = (fs::temp_directory_path() / "lightdock").string();
    }

    if (result.count("daemon")) {
      if (DaemonCreator::create(result["pidfile"].as<string>()) == -1) {
        STFATAL << "Error creating daemon: " << strerror(GetErrno());
      }
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    bool logToStdout = result.count("logtostdout") > 0;
    LogHandler::setupLogFile(&defaultConf, config.logDir, "lightdock",
                             logToStdout, config.maxlogsize);
    if (!logToStdout) {
      LogHandler::redirectStderr(config.logDir, "lightdock");
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("lightdock-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<ServerRegistry> registry(
        new ServerRegistry(config.registryPath));
    shared_ptr<RuntimeClientFactory> clientFactory(
        new DockerEngineClientFactory(config.connectTimeout,
                                      config.execTimeout));
    shared_ptr<ConnectionCache> connectionCache(
        new ConnectionCache(clientFactory));
    // Any registry change may point the active endpoint elsewhere
    registry->addChangeListener(
        [connectionCache]() { connectionCache->clear(); });

    shared_ptr<ReachabilityCache> reachabilityCache(
        new ReachabilityCache(chrono::seconds(config.reachabilityTtl)));
    shared_ptr<ReachabilityProber> prober(new ReachabilityProber(
        reachabilityCache, shared_ptr<HttpProber>(new HttplibProber()),
        config.probeWorkers, size_t(max(1, config.maxPendingProbes)),
        config.probeTimeout));

    shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    SocketEndpoint terminalEndpoint(config.bindIp, config.terminalPort);
    TerminalServer terminalServer(tcpSocketHandler, terminalEndpoint,
                                  connectionCache, registry);
    thread terminalThread([&terminalServer]() { terminalServer.run(); });

    LOG(INFO) << "Active runtime endpoint: " << registry->getActiveEndpoint();
    DashboardServer dashboardServer(registry, connectionCache,
                                    reachabilityCache, prober);
    CLOG(INFO, "stdout") << "LightDock dashboard on " << config.bindIp << ":"
                         << config.dashboardPort << ", terminals on port "
                         << config.terminalPort << endl;
    if (!dashboardServer.listen(config.bindIp, config.dashboardPort)) {
      STERROR << "Dashboard could not listen on " << config.bindIp << ":"
              << config.dashboardPort;
    }

    terminalServer.shutdown();
    terminalThread.join();
    prober->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
