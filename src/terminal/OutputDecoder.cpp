#include "OutputDecoder.hpp"

namespace ld {
namespace {
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

const map<string, string> ENTITIES = {
    {"amp", "&"},  {"lt", "<"},   {"gt", ">"},
    {"quot", "\""}, {"apos", "'"}, {"nbsp", " "},
};
}  // namespace

string decodeUtf8Lossy(const string &bytes) {
  string out;
  out.reserve(bytes.size());
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    unsigned char lead = bytes[i];
    if (lead < 0x80) {
      out.push_back(char(lead));
      i++;
      continue;
    }

    int needed;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      needed = 2;
      // Reject overlong forms and UTF-16 surrogates
      if (lead == 0xE0) lower = 0xA0;
      if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      needed = 3;
      if (lead == 0xF0) lower = 0x90;
      if (lead == 0xF4) upper = 0x8F;
    } else {
      out += REPLACEMENT_CHARACTER;
      i++;
      continue;
    }

    size_t j = i + 1;
    int seen = 0;
    while (seen < needed && j < n) {
      unsigned char c = bytes[j];
      if (c < lower || c > upper) {
        break;
      }
      lower = 0x80;
      upper = 0xBF;
      j++;
      seen++;
    }
    if (seen < needed) {
      out += REPLACEMENT_CHARACTER;
    } else {
      out.append(bytes, i, j - i);
    }
    i = j;
  }
  return out;
}

string extractPlainText(const string &bytes) {
  string text;
  bool inTag = false;
  for (size_t i = 0; i < bytes.size(); i++) {
    char c = bytes[i];
    if (inTag) {
      if (c == '>') {
        inTag = false;
      }
      continue;
    }
    if (c == '<') {
      inTag = true;
      continue;
    }
    if (c == '&') {
      auto end = bytes.find(';', i);
      if (end != string::npos && end - i <= 8) {
        auto it = ENTITIES.find(bytes.substr(i + 1, end - i - 1));
        if (it != ENTITIES.end()) {
          text += it->second;
          i = end;
          continue;
        }
      }
    }
    text.push_back((unsigned char)c < 0x80 ? c : '?');
  }
  return text;
}

string decodeOutput(const string &bytes, const string &placeholder) {
  string text;
  try {
    text = decodeUtf8Lossy(bytes);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Output decoding failed, extracting plain text: "
                 << e.what();
    text = extractPlainText(bytes);
  }
  if (text.empty()) {
    return placeholder;
  }
  return text;
}
}  // namespace ld
