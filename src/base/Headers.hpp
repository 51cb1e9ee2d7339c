#ifndef __LD_HEADERS__
#define __LD_HEADERS__

#define CPPHTTPLIB_ZLIB_SUPPORT (1)
#define CPPHTTPLIB_OPENSSL_SUPPORT (1)
// httplib pulls in the socket headers, keep it first
#include "httplib.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <pthread.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "LightDock.pb.h"
#include "ThreadPool.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Default ports for the two listeners
const int DEFAULT_DASHBOARD_PORT = 8008;
const int DEFAULT_TERMINAL_PORT = 8009;

// Well-known local Docker Engine socket
const string LOCAL_RUNTIME_SOCKET = "/var/run/docker.sock";

// Bound on establishing a runtime connection, in seconds
const int RUNTIME_CONNECT_TIMEOUT = 10;
// Bound on a single exec round trip, in seconds
const int RUNTIME_EXEC_TIMEOUT = 300;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef LD_VERSION
#define LD_VERSION "unknown"
#endif

namespace ld {
/** @brief Splits on `delim`, keeping empty fields. */
inline vector<string> split(const string &s, char delim) {
  vector<string> fields;
  string field;
  istringstream in(s);
  while (getline(in, field, delim)) {
    fields.push_back(field);
  }
  return fields;
}

/** @return The number of replacements made. */
inline int replaceAll(string &s, const string &from, const string &to) {
  if (from.empty()) {
    return 0;
  }
  int count = 0;
  for (size_t pos = s.find(from); pos != string::npos;
       pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
    count++;
  }
  return count;
}

// Strips leading and trailing whitespace (space, tab, CR, LF, VT, FF)
inline string trim(const string &s) {
  const char *ws = " \t\r\n\v\f";
  auto begin = s.find_first_not_of(ws);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

inline bool startsWith(const string &s, const string &prefix) {
  return s.size() >= prefix.size() &&
         s.compare(0, prefix.size(), prefix) == 0;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

/** @brief Waits up to a second for `fd` to become readable. */
inline bool waitOnSocketData(int fd) {
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd, &readable);
  timeval oneSecond = {1, 0};
  FATAL_FAIL(select(fd + 1, &readable, NULL, NULL, &oneSecond));
  return FD_ISSET(fd, &readable);
}

/** @brief Random [0-9A-Za-z] string drawn from libsodium. */
inline string genRandomAlphaNum(int len) {
  static const string alphabet =
      "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  string s;
  s.reserve(len);
  while (int(s.size()) < len) {
    s.push_back(alphabet[randombytes_uniform(uint32_t(alphabet.size()))]);
  }
  return s;
}

/** @brief Logs a stack trace for exceptions that escape a thread. */
inline void HandleTerminate() {
  static atomic<bool> installed(false);
  if (installed.exchange(true)) {
    return;
  }
  std::set_terminate([]() {
    auto current = std::current_exception();
    if (!current) {
      STFATAL << "terminate called without an exception";
      return;
    }
    try {
      std::rethrow_exception(current);
    } catch (const std::exception &e) {
      STFATAL << "Uncaught exception: " << e.what();
    } catch (...) {
      STFATAL << "Uncaught exception of unknown type";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Interrupted by signal " << signum;
  CLOG(INFO, "stdout") << endl << "Interrupted, exiting." << endl;
  ::exit(signum);
}
}  // namespace ld

#endif  // __LD_HEADERS__
