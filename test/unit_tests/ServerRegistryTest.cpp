#include "ServerRegistry.hpp"
#include "TestHeaders.hpp"

using namespace ld;

namespace {
class ServerRegistryFixture {
 public:
  ServerRegistryFixture() {
    directory = fs::temp_directory_path() /
                ("ld_registry_" + genRandomAlphaNum(8));
    path = (directory / "servers.db").string();
  }

  ~ServerRegistryFixture() {
    std::error_code ec;
    fs::remove_all(directory, ec);
  }

  fs::path directory;
  string path;
};
}  // namespace

TEST_CASE("The first server becomes active", "[ServerRegistry]") {
  ServerRegistry registry("");
  REQUIRE_FALSE(registry.getActive());
  REQUIRE(registry.getActiveEndpoint().isLocal());

  auto first = registry.add("prod", "10.0.0.1", "2375", "admin", "secret");
  auto second = registry.add("staging", "10.0.0.2", "2375", "", "");
  REQUIRE(first.active());
  REQUIRE_FALSE(second.active());
  REQUIRE(first.id() != second.id());
  REQUIRE(registry.getActive()->id() == first.id());
  REQUIRE(registry.getActiveEndpoint() ==
          RuntimeEndpoint::tcp("10.0.0.1", 2375));
  REQUIRE(registry.list().size() == 2);
}

TEST_CASE("Exactly one server is active", "[ServerRegistry]") {
  ServerRegistry registry("");
  auto a = registry.add("a", "10.0.0.1", "2375", "", "");
  auto b = registry.add("b", "10.0.0.2", "2375", "", "");
  auto c = registry.add("c", "", "", "", "");

  REQUIRE(registry.setActive(b.id()));
  int activeCount = 0;
  for (const auto &record : registry.list()) {
    activeCount += record.active() ? 1 : 0;
  }
  REQUIRE(activeCount == 1);
  REQUIRE(registry.getActive()->id() == b.id());

  SECTION("Unknown ids leave the registry unchanged") {
    REQUIRE_FALSE(registry.setActive(999));
    REQUIRE(registry.getActive()->id() == b.id());
  }

  SECTION("A server without an address targets the local socket") {
    registry.setActive(c.id());
    REQUIRE(registry.getActiveEndpoint().isLocal());
  }

  SECTION("Removing the active server activates the first remaining one") {
    REQUIRE(registry.remove(b.id()));
    REQUIRE(registry.getActive()->id() == a.id());
    REQUIRE_FALSE(registry.get(b.id()));
  }

  SECTION("Removing an inactive server keeps the active one") {
    REQUIRE(registry.remove(a.id()));
    REQUIRE(registry.getActive()->id() == b.id());
  }

  SECTION("Removing an unknown id does nothing") {
    REQUIRE_FALSE(registry.remove(999));
    REQUIRE(registry.list().size() == 3);
  }
}

TEST_CASE("Removing every server falls back to local", "[ServerRegistry]") {
  ServerRegistry registry("");
  auto a = registry.add("a", "10.0.0.1", "2375", "", "");
  registry.remove(a.id());
  REQUIRE(registry.list().empty());
  REQUIRE_FALSE(registry.getActive());
  REQUIRE(registry.getActiveEndpoint().isLocal());
}

TEST_CASE("Server fields are validated", "[ServerRegistry]") {
  ServerRegistry registry("");
  REQUIRE_THROWS_WITH(registry.add("  ", "h", "1", "", ""),
                      "Server name is required");
  REQUIRE_THROWS_AS(registry.add(string(101, 'n'), "h", "1", "", ""),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(registry.add("n", string(256, 'h'), "1", "", ""),
                    std::invalid_argument);
  REQUIRE_THROWS_WITH(registry.add("n", "h", "23a", "", ""),
                      "Port must contain only digits");
  REQUIRE_THROWS_AS(registry.add("n", "h", "65536", "", ""),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(registry.add("n", "h", "1", string(101, 'u'), ""),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(registry.add("n", "h", "1", "", string(256, 'p')),
                    std::invalid_argument);
  REQUIRE(registry.list().empty());

  auto maximal = registry.add(string(100, 'n'), string(255, 'h'), "65535",
                              string(100, 'u'), string(255, 'p'));
  REQUIRE(maximal.port() == "65535");
}

TEST_CASE("Listeners hear every change", "[ServerRegistry]") {
  ServerRegistry registry("");
  int changes = 0;
  registry.addChangeListener([&changes]() { changes++; });

  auto a = registry.add("a", "10.0.0.1", "2375", "", "");
  auto b = registry.add("b", "10.0.0.2", "2375", "", "");
  registry.setActive(b.id());
  registry.remove(a.id());
  REQUIRE(changes == 4);

  registry.setActive(999);
  registry.remove(999);
  REQUIRE_THROWS(registry.add("", "", "", "", ""));
  REQUIRE(changes == 4);
}

TEST_CASE("Server descriptions", "[ServerRegistry]") {
  ServerRegistry registry("");
  auto remote = registry.add("prod", "10.0.0.1", "2375", "", "");
  auto local = registry.add("laptop", "", "", "", "");
  REQUIRE(ServerRegistry::describe(remote) == "prod (tcp://10.0.0.1:2375)");
  REQUIRE(ServerRegistry::describe(local) == "laptop (local)");
}

TEST_CASE_METHOD(ServerRegistryFixture, "Servers persist across restarts",
                 "[ServerRegistry]") {
  int activeId;
  {
    ServerRegistry registry(path);
    registry.add("a", "10.0.0.1", "2375", "u", "p");
    activeId = registry.add("b", "10.0.0.2", "2376", "", "").id();
    registry.setActive(activeId);
  }
  REQUIRE(fs::exists(path));

  ServerRegistry reloaded(path);
  REQUIRE(reloaded.list().size() == 2);
  REQUIRE(reloaded.getActive()->id() == activeId);
  REQUIRE(reloaded.list()[0].user() == "u");

  // Ids are never reused
  auto c = reloaded.add("c", "", "", "", "");
  REQUIRE(c.id() > activeId);
}

TEST_CASE_METHOD(ServerRegistryFixture, "Corrupt registry files are reported",
                 "[ServerRegistry]") {
  fs::create_directories(directory);
  {
    ofstream out(path, ios::binary);
    out << "\xff\xff\xff\xff not a protobuf";
  }
  REQUIRE_THROWS_AS(ServerRegistry(path), std::runtime_error);
}
