#include "TestHeaders.hpp"
#include "WebSocketCodec.hpp"

using namespace ld;

namespace {
const string UPGRADE_HEAD =
    "GET /echo?id=abc%20d&mode=x HTTP/1.1\r\n"
    "Host: localhost:8009\r\n"
    "Upgrade: websocket\r\n"
    "Connection: keep-alive, Upgrade\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "\r\n";
}  // namespace

TEST_CASE("Accept key matches RFC 6455", "[WebSocketCodec]") {
  REQUIRE(WebSocketCodec::computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") ==
          "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
  auto response =
      WebSocketCodec::buildAcceptResponse("dGhlIHNhbXBsZSBub25jZQ==");
  REQUIRE(startsWith(response, "HTTP/1.1 101 Switching Protocols\r\n"));
  REQUIRE(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
          string::npos);
}

TEST_CASE("Upgrade request parsing", "[WebSocketCodec]") {
  WebSocketRequest request;
  string error;

  SECTION("Valid upgrade") {
    REQUIRE(WebSocketCodec::parseUpgradeRequest(UPGRADE_HEAD, &request,
                                                &error));
    REQUIRE(request.path == "/echo");
    REQUIRE(request.query["id"] == "abc d");
    REQUIRE(request.query["mode"] == "x");
    REQUIRE(request.headers["host"] == "localhost:8009");
  }

  SECTION("Missing key") {
    string head = UPGRADE_HEAD;
    replace(head, "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n", "");
    REQUIRE_FALSE(
        WebSocketCodec::parseUpgradeRequest(head, &request, &error));
    REQUIRE(error == "Missing Sec-WebSocket-Key");
  }

  SECTION("Plain HTTP request") {
    string head = UPGRADE_HEAD;
    replace(head, "Upgrade: websocket\r\n", "");
    REQUIRE_FALSE(
        WebSocketCodec::parseUpgradeRequest(head, &request, &error));
    REQUIRE(error == "Missing Upgrade: websocket");
  }

  SECTION("Wrong method") {
    string head = UPGRADE_HEAD;
    replace(head, "GET ", "POST ");
    REQUIRE_FALSE(
        WebSocketCodec::parseUpgradeRequest(head, &request, &error));
  }

  SECTION("Wrong version") {
    string head = UPGRADE_HEAD;
    replace(head, "Version: 13", "Version: 8");
    REQUIRE_FALSE(
        WebSocketCodec::parseUpgradeRequest(head, &request, &error));
    REQUIRE(error == "Unsupported WebSocket version");
  }
}

TEST_CASE("Query components are percent decoded", "[WebSocketCodec]") {
  REQUIRE(WebSocketCodec::decodeQueryComponent("a+b%2Fc") == "a b/c");
  REQUIRE(WebSocketCodec::decodeQueryComponent("100%") == "100%");
  REQUIRE(WebSocketCodec::decodeQueryComponent("%zz") == "%zz");
}

TEST_CASE("Server frames are unmasked", "[WebSocketCodec]") {
  REQUIRE(WebSocketCodec::encodeFrame(WS_TEXT, "hello") ==
          string("\x81\x05hello"));

  string longPayload(300, 'x');
  auto frame = WebSocketCodec::encodeFrame(WS_TEXT, longPayload);
  REQUIRE(frame.size() == 4 + 300);
  REQUIRE(uint8_t(frame[1]) == 126);
  REQUIRE(uint8_t(frame[2]) == 0x01);
  REQUIRE(uint8_t(frame[3]) == 0x2C);
  REQUIRE(WebSocketCodec::headerLength(uint8_t(frame[0]),
                                       uint8_t(frame[1])) == 4);
}

TEST_CASE("Masked client frames decode", "[WebSocketCodec]") {
  // The masked "Hello" example from RFC 6455 section 5.7
  const string masked("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11);
  WebSocketFrame frame;
  REQUIRE(WebSocketCodec::decodeFrame(masked, &frame) == 11);
  REQUIRE(frame.fin);
  REQUIRE(frame.masked);
  REQUIRE(frame.opcode == WS_TEXT);
  REQUIRE(frame.payload == "Hello");

  array<uint8_t, 4> key = {{0x37, 0xfa, 0x21, 0x3d}};
  REQUIRE(WebSocketCodec::encodeFrame(WS_TEXT, "Hello", true, key) == masked);

  SECTION("Incomplete frames need more bytes") {
    REQUIRE(WebSocketCodec::decodeFrame(masked.substr(0, 1), &frame) == 0);
    REQUIRE(WebSocketCodec::decodeFrame(masked.substr(0, 4), &frame) == 0);
    REQUIRE(WebSocketCodec::decodeFrame(masked.substr(0, 10), &frame) == 0);
  }

  SECTION("Trailing bytes are left for the next frame") {
    REQUIRE(WebSocketCodec::decodeFrame(masked + "\x81", &frame) == 11);
  }
}

TEST_CASE("Malformed frames are rejected", "[WebSocketCodec]") {
  WebSocketFrame frame;
  REQUIRE_THROWS_AS(WebSocketCodec::decodeFrame(string("\xC1\x00", 2), &frame),
                    std::runtime_error);

  string longPing = WebSocketCodec::encodeFrame(WS_PING, string(126, 'p'));
  REQUIRE_THROWS_AS(WebSocketCodec::decodeFrame(longPing, &frame),
                    std::runtime_error);

  string fragmentedClose =
      WebSocketCodec::encodeFrame(WS_CLOSE, "", false);
  REQUIRE_THROWS_AS(WebSocketCodec::decodeFrame(fragmentedClose, &frame),
                    std::runtime_error);
}

TEST_CASE("Close payload carries the status code", "[WebSocketCodec]") {
  auto payload = WebSocketCodec::encodeClosePayload(WS_CLOSE_NORMAL, "bye");
  REQUIRE(payload.size() == 5);
  REQUIRE(uint8_t(payload[0]) == 0x03);
  REQUIRE(uint8_t(payload[1]) == 0xE8);
  REQUIRE(payload.substr(2) == "bye");
}
