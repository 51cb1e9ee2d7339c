#include "DockerEngineClient.hpp"
#include "TestHeaders.hpp"

using namespace ld;

TEST_CASE("Container list documents", "[DockerEngineClient]") {
  auto document = json::parse(R"([
    {
      "Id": "4fa6e0f0c678",
      "Names": ["/web"],
      "Image": "nginx:latest",
      "State": "running",
      "Status": "Up 2 hours",
      "Ports": [
        {"IP": "0.0.0.0", "PrivatePort": 80, "PublicPort": 8080, "Type": "tcp"},
        {"PrivatePort": 443, "Type": "tcp"}
      ]
    },
    {"Id": "9cd87474be90", "Names": [], "State": "exited"}
  ])");

  auto containers = DockerEngineClient::parseContainerList(document);
  REQUIRE(containers.size() == 2);
  REQUIRE(containers[0].id == "4fa6e0f0c678");
  REQUIRE(containers[0].name == "web");
  REQUIRE(containers[0].image == "nginx:latest");
  REQUIRE(containers[0].status == "Up 2 hours");
  REQUIRE(containers[0].ports.size() == 2);
  REQUIRE(containers[0].ports[0].ip == "0.0.0.0");
  REQUIRE(containers[0].ports[0].publicPort == 8080);
  REQUIRE(containers[0].ports[1].publicPort == 0);
  REQUIRE(containers[1].name == "");
  REQUIRE(containers[1].state == "exited");
  REQUIRE(containers[1].ports.empty());

  REQUIRE_THROWS_AS(
      DockerEngineClient::parseContainerList(json::parse(R"({"a": 1})")),
      ApiError);
}

TEST_CASE("Inspect port bindings", "[DockerEngineClient]") {
  auto inspect = json::parse(R"({
    "Id": "4fa6e0f0c678",
    "NetworkSettings": {
      "Ports": {
        "80/tcp": [
          {"HostIp": "0.0.0.0", "HostPort": "8080"},
          {"HostIp": "::", "HostPort": "8080"}
        ],
        "53/udp": [{"HostIp": "127.0.0.1", "HostPort": "5353"}],
        "9000/tcp": null
      }
    }
  })");

  auto ports = DockerContainer::parseInspectPorts(inspect);
  REQUIRE(ports.size() == 4);

  int published = 0;
  for (const auto &port : ports) {
    if (port.privatePort == 80) {
      REQUIRE(port.publicPort == 8080);
      REQUIRE(port.type == "tcp");
      published++;
    } else if (port.privatePort == 53) {
      REQUIRE(port.type == "udp");
      REQUIRE(port.ip == "127.0.0.1");
      REQUIRE(port.publicPort == 5353);
    } else {
      REQUIRE(port.privatePort == 9000);
      REQUIRE(port.publicPort == 0);
    }
  }
  REQUIRE(published == 2);

  REQUIRE(DockerContainer::parseInspectPorts(json::parse("{}")).empty());
  REQUIRE(DockerContainer::parseInspectPorts(
              json::parse(R"({"NetworkSettings": {"Ports": null}})"))
              .empty());
}

TEST_CASE("Path segments are percent encoded", "[DockerEngineClient]") {
  REQUIRE(DockerEngineClient::encodePathSegment("web_1.a-b~") == "web_1.a-b~");
  REQUIRE(DockerEngineClient::encodePathSegment("a/b c") == "a%2Fb%20c");
  REQUIRE(DockerEngineClient::encodePathSegment("../x") == "..%2Fx");
}
