#include "BatchActions.hpp"
#include "FakeRuntimeClient.hpp"
#include "TestHeaders.hpp"

using namespace ld;

TEST_CASE("Action names", "[BatchActions]") {
  REQUIRE(BatchActions::parseAction("Start") == ContainerAction::START);
  REQUIRE(BatchActions::parseAction("STOP") == ContainerAction::STOP);
  REQUIRE(BatchActions::parseAction("restart") == ContainerAction::RESTART);
  REQUIRE(BatchActions::parseAction("Delete") == ContainerAction::DELETE);
  REQUIRE_FALSE(BatchActions::parseAction("pause"));
  REQUIRE(BatchActions::pastTense(ContainerAction::STOP) == "stopped");
}

TEST_CASE("A missing container does not stop the batch", "[BatchActions]") {
  FakeRuntimeClient client{RuntimeEndpoint()};
  auto a = make_shared<FakeContainer>("A", "alpha");
  auto c = make_shared<FakeContainer>("C", "gamma");
  client.addContainer(a);
  client.addContainer(c);

  auto result =
      BatchActions::run(client, ContainerAction::STOP, {"A", "B", "C"});
  REQUIRE(result.succeeded == 2);
  REQUIRE(result.errors == vector<string>({"Container B not found"}));
  REQUIRE(BatchActions::summarize(result) == "2 container(s) stopped");
  REQUIRE(a->getActions() == vector<string>({"stop"}));
  REQUIRE(c->getActions() == vector<string>({"stop"}));
}

TEST_CASE("Batch errors use short ids", "[BatchActions]") {
  FakeRuntimeClient client{RuntimeEndpoint()};
  string longId = "0123456789abcdef0123456789abcdef";
  auto broken = make_shared<FakeContainer>(longId, "broken");
  broken->actionError = "cannot kill container";
  client.addContainer(broken);

  auto result = BatchActions::run(client, ContainerAction::RESTART,
                                  {longId, "fedcba9876543210"});
  REQUIRE(result.succeeded == 0);
  REQUIRE(result.errors ==
          vector<string>({"Container 0123456789ab: cannot kill container",
                          "Container fedcba987654 not found"}));
  REQUIRE(BatchActions::summarize(result) == "0 container(s) restarted");
}

TEST_CASE("Delete forces removal", "[BatchActions]") {
  FakeRuntimeClient client{RuntimeEndpoint()};
  auto a = make_shared<FakeContainer>("A", "alpha");
  client.addContainer(a);

  auto result = BatchActions::run(client, ContainerAction::DELETE, {"A"});
  REQUIRE(result.succeeded == 1);
  REQUIRE(result.errors.empty());
  REQUIRE(a->getActions() == vector<string>({"remove-force"}));
}
