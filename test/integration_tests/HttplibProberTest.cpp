#include "HttpProber.hpp"
#include "TestHeaders.hpp"

namespace ld {
class LocalHttpServer {
 public:
  LocalHttpServer() : port(-1) {}

  /** @brief Call after the routes are registered. */
  void start() {
    port = server.bind_to_any_port("127.0.0.1");
    serverThread = thread([this]() { server.listen_after_bind(); });
    while (!server.is_running()) {
      this_thread::sleep_for(chrono::milliseconds(1));
    }
  }

  ~LocalHttpServer() {
    if (serverThread.joinable()) {
      server.stop();
      serverThread.join();
    }
  }

  httplib::Server server;
  thread serverThread;
  int port;
};

TEST_CASE("Live HTTP servers are reachable", "[HttplibProber][integration]") {
  LocalHttpServer local;
  local.server.Get("/", [](const httplib::Request &, httplib::Response &res) {
    res.set_content("ok", "text/plain");
  });
  local.start();

  HttplibProber prober;
  REQUIRE(prober.probe("127.0.0.1", local.port, 1.0) ==
          ProbeOutcome::REACHABLE);
}

TEST_CASE("GET is tried when HEAD is refused", "[HttplibProber][integration]") {
  LocalHttpServer local;
  atomic<int> gets(0);
  local.server.Get("/", [&gets](const httplib::Request &req,
                                httplib::Response &res) {
    if (req.method == "HEAD") {
      res.status = 405;
      return;
    }
    gets++;
    res.set_content("ok", "text/plain");
  });
  local.start();

  HttplibProber prober;
  REQUIRE(prober.probe("127.0.0.1", local.port, 1.0) ==
          ProbeOutcome::REACHABLE);
  REQUIRE(gets == 1);
}

TEST_CASE("Error statuses are unreachable", "[HttplibProber][integration]") {
  LocalHttpServer local;
  local.server.Get("/", [](const httplib::Request &, httplib::Response &res) {
    res.status = 500;
  });
  local.start();

  HttplibProber prober;
  REQUIRE(prober.probe("127.0.0.1", local.port, 1.0) ==
          ProbeOutcome::UNREACHABLE);
}

TEST_CASE("Closed ports are unreachable", "[HttplibProber][integration]") {
  int port;
  {
    LocalHttpServer local;
    local.start();
    port = local.port;
  }
  HttplibProber prober;
  REQUIRE(prober.probe("127.0.0.1", port, 0.3) != ProbeOutcome::REACHABLE);
}
}  // namespace ld
