#include "HttpProber.hpp"

namespace ld {
ProbeOutcome HttplibProber::probe(const string &host, int port,
                                  double timeoutSeconds) {
  string bareHost = host;
  if (bareHost.size() > 2 && bareHost.front() == '[' &&
      bareHost.back() == ']') {
    bareHost = bareHost.substr(1, bareHost.size() - 2);
  }
  if (timeoutSeconds <= 0) {
    timeoutSeconds = 0.45;
  }
  time_t seconds = time_t(timeoutSeconds);
  time_t microseconds = time_t((timeoutSeconds - double(seconds)) * 1000000.0);

  try {
    httplib::Client client(bareHost, port);
    client.set_connection_timeout(seconds, microseconds);
    client.set_read_timeout(seconds, microseconds);
    client.set_write_timeout(seconds, microseconds);
    client.set_keep_alive(false);

    auto headResult = client.Head("/");
    if (headResult && headResult->status < 400) {
      return ProbeOutcome::REACHABLE;
    }
    if (!headResult) {
      VLOG(2) << "HEAD " << bareHost << ":" << port
              << " failed: " << httplib::to_string(headResult.error());
    }

    auto getResult = client.Get("/");
    if (getResult && getResult->status < 400) {
      return ProbeOutcome::REACHABLE;
    }
    if (!getResult) {
      VLOG(2) << "GET " << bareHost << ":" << port
              << " failed: " << httplib::to_string(getResult.error());
    }
    return ProbeOutcome::UNREACHABLE;
  } catch (const std::exception &e) {
    VLOG(1) << "Probe of " << bareHost << ":" << port
            << " raised: " << e.what();
    return ProbeOutcome::ERROR;
  }
}
}  // namespace ld
