#include "CommandSplit.hpp"

namespace ld {
vector<string> splitCommandLine(const string &commandLine) {
  vector<string> args;
  string current;
  bool inToken = false;
  size_t i = 0;
  while (i < commandLine.size()) {
    char c = commandLine[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      if (inToken) {
        args.push_back(current);
        current.clear();
        inToken = false;
      }
      i++;
      continue;
    }
    inToken = true;
    if (c == '\'') {
      auto end = commandLine.find('\'', i + 1);
      if (end == string::npos) {
        throw std::runtime_error("No closing quotation");
      }
      current.append(commandLine, i + 1, end - i - 1);
      i = end + 1;
    } else if (c == '"') {
      i++;
      bool closed = false;
      while (i < commandLine.size()) {
        char d = commandLine[i];
        if (d == '"') {
          closed = true;
          i++;
          break;
        }
        if (d == '\\' && i + 1 < commandLine.size()) {
          char next = commandLine[i + 1];
          // Inside double quotes only these characters are escapable
          if (next == '\\' || next == '"' || next == '$' || next == '`' ||
              next == '\n') {
            current.push_back(next);
            i += 2;
            continue;
          }
        }
        current.push_back(d);
        i++;
      }
      if (!closed) {
        throw std::runtime_error("No closing quotation");
      }
    } else if (c == '\\') {
      if (i + 1 >= commandLine.size()) {
        throw std::runtime_error("No escaped character");
      }
      current.push_back(commandLine[i + 1]);
      i += 2;
    } else {
      current.push_back(c);
      i++;
    }
  }
  if (inToken) {
    args.push_back(current);
  }
  return args;
}

string quoteShellArgument(const string &argument) {
  static const string safe =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
      "@%+=:,./-_";
  if (!argument.empty() &&
      argument.find_first_not_of(safe) == string::npos) {
    return argument;
  }
  string quoted = argument;
  replaceAll(quoted, "'", "'\\''");
  return "'" + quoted + "'";
}
}  // namespace ld
