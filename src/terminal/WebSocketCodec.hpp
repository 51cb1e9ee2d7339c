#ifndef __LD_WEBSOCKET_CODEC__
#define __LD_WEBSOCKET_CODEC__

#include "Headers.hpp"

namespace ld {
enum WebSocketOpcode : uint8_t {
  WS_CONTINUATION = 0x0,
  WS_TEXT = 0x1,
  WS_BINARY = 0x2,
  WS_CLOSE = 0x8,
  WS_PING = 0x9,
  WS_PONG = 0xA,
};

/** @brief Normal closure status code. */
const uint16_t WS_CLOSE_NORMAL = 1000;
/** @brief Status code for a malformed frame. */
const uint16_t WS_CLOSE_PROTOCOL_ERROR = 1002;
/** @brief Largest message accepted from a client. */
const size_t WS_MAX_PAYLOAD = 16 * 1024 * 1024;

struct WebSocketFrame {
  bool fin = true;
  uint8_t opcode = WS_TEXT;
  bool masked = false;
  /** @brief Unmasked payload. */
  string payload;
};

struct WebSocketRequest {
  string path;
  map<string, string> query;
  /** @brief Header names are lower-cased. */
  map<string, string> headers;
};

/**
 * @brief RFC 6455 handshake and framing helpers. Frames sent by the server
 * are never masked; frames from a client must be.
 */
class WebSocketCodec {
 public:
  /** @brief base64(SHA-1(key + GUID)) for Sec-WebSocket-Accept. */
  static string computeAcceptKey(const string &clientKey);

  /**
   * @brief Parses the HTTP upgrade request head (up to the blank line).
   * @return false with `error` set when it is not a valid upgrade.
   */
  static bool parseUpgradeRequest(const string &head, WebSocketRequest *request,
                                  string *error);

  static string buildAcceptResponse(const string &clientKey);

  static string buildErrorResponse(int status, const string &message);

  /**
   * @brief Serializes one frame. A mask is applied when `maskKey` is set.
   */
  static string encodeFrame(uint8_t opcode, const string &payload,
                            bool fin = true,
                            const optional<array<uint8_t, 4>> &maskKey =
                                nullopt);

  /** @brief The close frame payload: big endian status then reason. */
  static string encodeClosePayload(uint16_t status, const string &reason);

  /**
   * @brief Length of the full header given its first two bytes.
   */
  static size_t headerLength(uint8_t byte0, uint8_t byte1);

  /**
   * @brief Decodes one frame from the front of `buffer`.
   * @return Bytes consumed, or 0 when `buffer` holds an incomplete frame.
   * @throws std::runtime_error on reserved bits, an oversized payload or a
   * malformed control frame.
   */
  static size_t decodeFrame(const string &buffer, WebSocketFrame *frame);

  /** @brief Percent-decodes a query component, `+` becomes a space. */
  static string decodeQueryComponent(const string &component);
};
}  // namespace ld

#endif  // __LD_WEBSOCKET_CODEC__
