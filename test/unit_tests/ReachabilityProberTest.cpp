#include "FakeHttpProber.hpp"
#include "ReachabilityProber.hpp"
#include "TestHeaders.hpp"

using namespace ld;

TEST_CASE("Background probe records the first reachable port",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->setOutcome("10.0.0.5", 443, ProbeOutcome::REACHABLE);
  fakeProber->setOutcome("10.0.0.5", 8000, ProbeOutcome::REACHABLE);
  ReachabilityProber prober(cache, fakeProber, 2);

  REQUIRE(prober.scheduleProbe("web", "10.0.0.5", {8000, 22, 443, 3000}));
  prober.shutdown();

  REQUIRE(cache->lookup("web") == optional<string>("http://10.0.0.5:443/"));
  // Stops at the first success
  REQUIRE(fakeProber->getProbedPorts() == vector<int>({443}));
}

TEST_CASE("Ports are probed in preference order and misses are cached",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->setOutcome("h", 3000, ProbeOutcome::ERROR);
  ReachabilityProber prober(cache, fakeProber, 1);

  REQUIRE(prober.scheduleProbe("db", "h", {8000, 22, 443, 3000}));
  prober.shutdown();

  REQUIRE(fakeProber->getProbedPorts() == vector<int>({443, 8000, 3000, 22}));
  REQUIRE(cache->lookupState("db") == ReachabilityState::UNREACHABLE);
}

TEST_CASE("A container is probed at most once at a time",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->hold();
  ReachabilityProber prober(cache, fakeProber, 4);

  REQUIRE(prober.scheduleProbe("web", "h", {80}));
  REQUIRE_FALSE(prober.scheduleProbe("web", "h", {80}));
  REQUIRE(prober.scheduleProbe("other", "h", {80}));
  REQUIRE(prober.getPendingCount() == 2);

  fakeProber->release();
  prober.shutdown();
  REQUIRE(prober.getPendingCount() == 0);
  REQUIRE(cache->lookupState("web") == ReachabilityState::UNREACHABLE);
}

TEST_CASE("Scheduling is refused when the queue is full",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->hold();
  ReachabilityProber prober(cache, fakeProber, 1, 2);

  REQUIRE(prober.scheduleProbe("a", "h", {80}));
  REQUIRE(prober.scheduleProbe("b", "h", {80}));
  REQUIRE_FALSE(prober.scheduleProbe("c", "h", {80}));

  fakeProber->release();
  prober.shutdown();
  REQUIRE(cache->lookupState("c") == ReachabilityState::UNKNOWN);
}

TEST_CASE("Scheduling after shutdown is a no-op", "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  ReachabilityProber prober(cache, fakeProber, 1);
  prober.shutdown();

  REQUIRE_FALSE(prober.scheduleProbe("a", "h", {80}));
  REQUIRE_FALSE(prober.scheduleDiscovery(
      "a", []() -> optional<ProbeTask> { return nullopt; }));
  REQUIRE(fakeProber->getCalls().empty());
}

TEST_CASE("Discovery resolves the target on the worker",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->setOutcome("192.168.1.9", 8080, ProbeOutcome::REACHABLE);
  ReachabilityProber prober(cache, fakeProber, 2);

  REQUIRE(prober.scheduleDiscovery("found", []() -> optional<ProbeTask> {
    ProbeTask task;
    task.containerId = "found";
    task.host = "192.168.1.9";
    task.candidatePorts = {8080};
    return task;
  }));
  REQUIRE(prober.scheduleDiscovery(
      "noports", []() -> optional<ProbeTask> { return nullopt; }));
  REQUIRE(prober.scheduleDiscovery("gone", []() -> optional<ProbeTask> {
    throw std::runtime_error("No such container: gone");
  }));
  prober.shutdown();

  REQUIRE(cache->lookup("found") ==
          optional<string>("http://192.168.1.9:8080/"));
  REQUIRE(cache->lookupState("noports") == ReachabilityState::UNREACHABLE);
  REQUIRE(cache->lookupState("gone") == ReachabilityState::UNREACHABLE);
}

TEST_CASE("Discovery by name also fills the full id entry",
          "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->setOutcome("10.0.0.2", 80, ProbeOutcome::REACHABLE);
  ReachabilityProber prober(cache, fakeProber, 1);

  REQUIRE(prober.scheduleDiscovery("web", []() -> optional<ProbeTask> {
    ProbeTask task;
    task.containerId = "0123456789abcdef";
    task.host = "10.0.0.2";
    task.candidatePorts = {80};
    return task;
  }));
  prober.shutdown();

  REQUIRE(cache->lookup("web") == optional<string>("http://10.0.0.2:80/"));
  REQUIRE(cache->lookup("0123456789abcdef") ==
          optional<string>("http://10.0.0.2:80/"));
}

TEST_CASE("Synchronous probe", "[ReachabilityProber]") {
  auto cache = make_shared<ReachabilityCache>();
  auto fakeProber = make_shared<FakeHttpProber>();
  fakeProber->setOutcome("h", 3000, ProbeOutcome::REACHABLE);
  ReachabilityProber prober(cache, fakeProber, 1);

  SECTION("Returns the first reachable URL without touching the cache") {
    REQUIRE(prober.probeNow("h", {9999, 3000}, 0.2) ==
            optional<string>("http://h:3000/"));
    REQUIRE(fakeProber->getProbedPorts() == vector<int>({3000}));
    REQUIRE(cache->size() == 0);
  }

  SECTION("Returns nothing when no port answers") {
    REQUIRE_FALSE(prober.probeNow("h", {1, 2}, 0.2));
  }

  SECTION("Records the result when a container is named") {
    REQUIRE_FALSE(prober.probeNow("h", {22}, 0.2, string("web")));
    REQUIRE(cache->lookupState("web") == ReachabilityState::UNREACHABLE);
  }
}
