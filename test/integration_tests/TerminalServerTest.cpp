#include "FakeRuntimeClient.hpp"
#include "TcpSocketHandler.hpp"
#include "TerminalServer.hpp"
#include "TestHeaders.hpp"
#include "WebSocketTestClient.hpp"

namespace ld {
class TerminalServerFixture {
 public:
  TerminalServerFixture()
      : factory(new FakeRuntimeClientFactory()),
        connectionCache(new ConnectionCache(factory)),
        registry(new ServerRegistry("")),
        serverSocketHandler(new TcpSocketHandler()),
        clientSocketHandler(new TcpSocketHandler()) {
    container = factory->addContainer("c0ffee", "web");
    container->execOutputs["ls -al /tmp"] = "total 0\n";

    for (int attempt = 0;; attempt++) {
      port = 20000 + rand() % 10000;
      try {
        server.reset(new TerminalServer(serverSocketHandler,
                                        SocketEndpoint(port), connectionCache,
                                        registry));
        break;
      } catch (const std::runtime_error &e) {
        if (attempt >= 10) {
          throw;
        }
      }
    }
    serverThread = thread([this]() { server->run(); });
  }

  ~TerminalServerFixture() {
    server->shutdown();
    serverThread.join();
  }

  bool waitForSessionCount(size_t expected) {
    for (int i = 0; i < 500; i++) {
      if (server->getActiveSessionCount() == expected) {
        return true;
      }
      this_thread::sleep_for(chrono::milliseconds(10));
    }
    return false;
  }

  shared_ptr<FakeRuntimeClientFactory> factory;
  shared_ptr<ConnectionCache> connectionCache;
  shared_ptr<ServerRegistry> registry;
  shared_ptr<FakeContainer> container;
  shared_ptr<SocketHandler> serverSocketHandler;
  shared_ptr<SocketHandler> clientSocketHandler;
  shared_ptr<TerminalServer> server;
  thread serverThread;
  int port;
};

TEST_CASE_METHOD(TerminalServerFixture, "Terminal session over WebSocket",
                 "[TerminalServer][integration]") {
  WebSocketTestClient client(clientSocketHandler, port, "/echo?id=c0ffee");
  REQUIRE(client.getStatus() == 101);
  REQUIRE(client.getResponseHead().find(
              "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
          string::npos);

  client.sendText("pwd");
  REQUIRE(client.receiveText() == optional<string>("/"));
  client.sendText("cd /tmp");
  REQUIRE(client.receiveText() ==
          optional<string>("Changed directory to /tmp"));
  client.sendText("ls");
  REQUIRE(client.receiveText() == optional<string>("total 0\n"));
  REQUIRE(waitForSessionCount(1));

  client.sendText("exit");
  REQUIRE(client.receiveText() == optional<string>("Goodbye!"));
  REQUIRE_FALSE(client.receiveText());
  REQUIRE(waitForSessionCount(0));
}

TEST_CASE_METHOD(TerminalServerFixture, "Fragmented messages and pings",
                 "[TerminalServer][integration]") {
  WebSocketTestClient client(clientSocketHandler, port, "/echo?id=web");
  REQUIRE(client.getStatus() == 101);

  client.sendFrame(WS_PING, "tick");
  auto pong = client.readFrame();
  REQUIRE(pong.opcode == WS_PONG);
  REQUIRE(pong.payload == "tick");

  client.sendFrame(WS_TEXT, "echo hel", false);
  client.sendFrame(WS_CONTINUATION, "lo", true);
  REQUIRE(client.receiveText() == optional<string>("hello"));
}

TEST_CASE_METHOD(TerminalServerFixture, "Sessions are independent",
                 "[TerminalServer][integration]") {
  WebSocketTestClient first(clientSocketHandler, port, "/echo?id=c0ffee");
  WebSocketTestClient second(clientSocketHandler, port, "/echo?id=c0ffee");

  first.sendText("cd /srv");
  REQUIRE(first.receiveText() == optional<string>("Changed directory to /srv"));
  second.sendText("pwd");
  REQUIRE(second.receiveText() == optional<string>("/"));
  REQUIRE(waitForSessionCount(2));

  first.sendFrame(WS_CLOSE,
                  WebSocketCodec::encodeClosePayload(WS_CLOSE_NORMAL, ""));
  REQUIRE_FALSE(first.receiveText());
  REQUIRE(waitForSessionCount(1));
}

TEST_CASE_METHOD(TerminalServerFixture, "Connections without a usable target",
                 "[TerminalServer][integration]") {
  SECTION("Missing container id") {
    WebSocketTestClient client(clientSocketHandler, port, "/echo");
    REQUIRE(client.getStatus() == 101);
    REQUIRE(client.receiveText() ==
            optional<string>("Error: No container ID provided"));
    REQUIRE_FALSE(client.receiveText());
  }

  SECTION("Unknown container") {
    WebSocketTestClient client(clientSocketHandler, port, "/echo?id=nope");
    REQUIRE(client.receiveText() ==
            optional<string>("Error: Container nope not found"));
    REQUIRE_FALSE(client.receiveText());
  }

  SECTION("Unknown path") {
    WebSocketTestClient client(clientSocketHandler, port, "/shell?id=c0ffee");
    REQUIRE(client.getStatus() == 404);
  }
}

TEST_CASE_METHOD(TerminalServerFixture, "Shutdown ends idle sessions",
                 "[TerminalServer][integration]") {
  WebSocketTestClient client(clientSocketHandler, port, "/echo?id=c0ffee");
  client.sendText("pwd");
  REQUIRE(client.receiveText() == optional<string>("/"));

  server->shutdown();
  serverThread.join();
  REQUIRE(server->getActiveSessionCount() == 0);
  // The destructor joins again, so hand it a finished thread
  serverThread = thread([]() {});
}
}  // namespace ld
