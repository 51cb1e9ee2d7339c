#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ld {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[V%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

string LogHandler::setupLogFile(el::Configurations *conf,
                                const string &directory, const string &prefix,
                                bool alsoToStdout, const string &maxLogSize) {
  string path = createFile(directory, newFileName(prefix, "log"));
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::Filename, path);
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    alsoToStdout ? "true" : "false");
  return path;
}

void LogHandler::redirectStderr(const string &directory, const string &prefix) {
  string path = createFile(directory, newFileName(prefix, "stderr"));
  FILE *stream = freopen(path.c_str(), "w", stderr);
  if (stream == NULL) {
    STFATAL << "Cannot reopen stderr on " << path;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // Called with the file already closed; logging from here recurses
  ::remove(filename);
}

string LogHandler::newFileName(const string &prefix, const string &kind) {
  char stamp[32];
  time_t now = time(NULL);
  tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
  return prefix + "-" + kind + "-" + stamp + "-" + to_string(getpid()) +
         ".log";
}

string LogHandler::createFile(const string &directory, const string &name) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << ec.message() << endl;
    exit(1);
  }
  string path = (fs::path(directory) / name).string();
  int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_NOFOLLOW | O_WRONLY, 0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return path;
}
}  // namespace ld
