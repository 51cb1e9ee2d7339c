#include "WebSocketCodec.hpp"

#include <openssl/evp.h>

#include "base64.h"

namespace ld {
namespace {
const char *WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

string toLower(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return char(tolower(c)); });
  return s;
}

bool headerHasToken(const string &value, const string &token) {
  for (const auto &part : split(value, ',')) {
    if (toLower(trim(part)) == token) {
      return true;
    }
  }
  return false;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

string WebSocketCodec::computeAcceptKey(const string &clientKey) {
  string input = clientKey + WEBSOCKET_GUID;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (!EVP_Digest(input.data(), input.size(), digest, &digestLength,
                  EVP_sha1(), NULL)) {
    throw std::runtime_error("SHA-1 digest failed");
  }
  string encoded;
  if (!Base64::Encode(string((const char *)digest, digestLength), &encoded)) {
    throw std::runtime_error("base64 encode failed");
  }
  return encoded;
}

string WebSocketCodec::decodeQueryComponent(const string &component) {
  string out;
  for (size_t i = 0; i < component.size(); i++) {
    char c = component[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < component.size() &&
               hexValue(component[i + 1]) >= 0 &&
               hexValue(component[i + 2]) >= 0) {
      out.push_back(
          char(hexValue(component[i + 1]) * 16 + hexValue(component[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool WebSocketCodec::parseUpgradeRequest(const string &head,
                                         WebSocketRequest *request,
                                         string *error) {
  string normalized = head;
  replaceAll(normalized, "\r\n", "\n");
  auto lines = split(normalized, '\n');
  if (lines.empty()) {
    *error = "Empty request";
    return false;
  }

  auto requestLine = split(lines[0], ' ');
  if (requestLine.size() != 3 || requestLine[0] != "GET" ||
      !startsWith(requestLine[2], "HTTP/1.1")) {
    *error = "Expected a GET HTTP/1.1 request";
    return false;
  }

  string target = requestLine[1];
  auto queryStart = target.find('?');
  request->path = target.substr(0, queryStart);
  request->query.clear();
  if (queryStart != string::npos) {
    for (const auto &pair : split(target.substr(queryStart + 1), '&')) {
      if (pair.empty()) {
        continue;
      }
      auto eq = pair.find('=');
      string key = decodeQueryComponent(pair.substr(0, eq));
      string value =
          eq == string::npos ? "" : decodeQueryComponent(pair.substr(eq + 1));
      request->query[key] = value;
    }
  }

  request->headers.clear();
  for (size_t i = 1; i < lines.size(); i++) {
    if (lines[i].empty()) {
      break;
    }
    auto colon = lines[i].find(':');
    if (colon == string::npos) {
      *error = "Malformed header line";
      return false;
    }
    request->headers[toLower(trim(lines[i].substr(0, colon)))] =
        trim(lines[i].substr(colon + 1));
  }

  auto &headers = request->headers;
  if (!headers.count("upgrade") ||
      !headerHasToken(headers["upgrade"], "websocket")) {
    *error = "Missing Upgrade: websocket";
    return false;
  }
  if (!headers.count("connection") ||
      !headerHasToken(headers["connection"], "upgrade")) {
    *error = "Missing Connection: Upgrade";
    return false;
  }
  if (!headers.count("sec-websocket-key") ||
      headers["sec-websocket-key"].empty()) {
    *error = "Missing Sec-WebSocket-Key";
    return false;
  }
  if (headers.count("sec-websocket-version") &&
      headers["sec-websocket-version"] != "13") {
    *error = "Unsupported WebSocket version";
    return false;
  }
  return true;
}

string WebSocketCodec::buildAcceptResponse(const string &clientKey) {
  return "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Accept: " +
         computeAcceptKey(clientKey) + "\r\n\r\n";
}

string WebSocketCodec::buildErrorResponse(int status, const string &message) {
  return "HTTP/1.1 " + to_string(status) + " " +
         httplib::status_message(status) +
         "\r\n"
         "Content-Type: text/plain\r\n"
         "Content-Length: " +
         to_string(message.size()) +
         "\r\n"
         "Connection: close\r\n\r\n" +
         message;
}

string WebSocketCodec::encodeFrame(uint8_t opcode, const string &payload,
                                   bool fin,
                                   const optional<array<uint8_t, 4>> &maskKey) {
  string frame;
  frame.push_back(char((fin ? 0x80 : 0x00) | (opcode & 0x0F)));
  uint8_t maskBit = maskKey ? 0x80 : 0x00;
  uint64_t length = payload.size();
  if (length < 126) {
    frame.push_back(char(maskBit | uint8_t(length)));
  } else if (length <= 0xFFFF) {
    frame.push_back(char(maskBit | 126));
    frame.push_back(char((length >> 8) & 0xFF));
    frame.push_back(char(length & 0xFF));
  } else {
    frame.push_back(char(maskBit | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(char((length >> shift) & 0xFF));
    }
  }
  if (!maskKey) {
    frame += payload;
    return frame;
  }
  for (int i = 0; i < 4; i++) {
    frame.push_back(char((*maskKey)[i]));
  }
  for (size_t i = 0; i < payload.size(); i++) {
    frame.push_back(char(uint8_t(payload[i]) ^ (*maskKey)[i % 4]));
  }
  return frame;
}

string WebSocketCodec::encodeClosePayload(uint16_t status,
                                          const string &reason) {
  string payload;
  payload.push_back(char(status >> 8));
  payload.push_back(char(status & 0xFF));
  return payload + reason;
}

size_t WebSocketCodec::headerLength(uint8_t byte0, uint8_t byte1) {
  size_t length = 2;
  uint8_t lengthCode = byte1 & 0x7F;
  if (lengthCode == 126) {
    length += 2;
  } else if (lengthCode == 127) {
    length += 8;
  }
  if (byte1 & 0x80) {
    length += 4;
  }
  return length;
}

size_t WebSocketCodec::decodeFrame(const string &buffer,
                                   WebSocketFrame *frame) {
  if (buffer.size() < 2) {
    return 0;
  }
  auto bytes = (const uint8_t *)buffer.data();
  if (bytes[0] & 0x70) {
    throw std::runtime_error("WebSocket frame uses reserved bits");
  }
  size_t header = headerLength(bytes[0], bytes[1]);
  if (buffer.size() < header) {
    return 0;
  }

  frame->fin = (bytes[0] & 0x80) != 0;
  frame->opcode = bytes[0] & 0x0F;
  frame->masked = (bytes[1] & 0x80) != 0;

  uint64_t length = bytes[1] & 0x7F;
  size_t offset = 2;
  if (length == 126) {
    length = (uint64_t(bytes[2]) << 8) | bytes[3];
    offset = 4;
  } else if (length == 127) {
    length = 0;
    for (int i = 0; i < 8; i++) {
      length = (length << 8) | bytes[2 + i];
    }
    offset = 10;
  }
  if (length > WS_MAX_PAYLOAD) {
    throw std::runtime_error("WebSocket frame too large: " +
                             to_string(length));
  }
  if ((frame->opcode & 0x08) && (length > 125 || !frame->fin)) {
    throw std::runtime_error("Malformed WebSocket control frame");
  }

  uint8_t mask[4] = {0, 0, 0, 0};
  if (frame->masked) {
    memcpy(mask, bytes + offset, 4);
    offset += 4;
  }
  if (buffer.size() < offset + length) {
    return 0;
  }
  frame->payload = buffer.substr(offset, length);
  if (frame->masked) {
    for (size_t i = 0; i < frame->payload.size(); i++) {
      frame->payload[i] = char(uint8_t(frame->payload[i]) ^ mask[i % 4]);
    }
  }
  return offset + length;
}
}  // namespace ld
