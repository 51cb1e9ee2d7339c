#include "TerminalSession.hpp"

#include "CommandSplit.hpp"
#include "OutputDecoder.hpp"
#include "PathUtils.hpp"

namespace ld {
const string TerminalSession::HELP_TEXT =
    "Available commands:\n"
    "  help, ?        Show this help\n"
    "  clear          Clear the screen\n"
    "  pwd            Print the working directory\n"
    "  cd <dir>       Change the working directory\n"
    "  ls [dir]       List a directory\n"
    "  cat <file>     Print a file\n"
    "  echo <text>    Echo text back\n"
    "  exit           Close this session\n"
    "Any other input runs inside the container.";

TerminalSession::TerminalSession(shared_ptr<TerminalChannel> _channel,
                                 shared_ptr<ConnectionCache> _connectionCache,
                                 shared_ptr<ServerRegistry> _registry,
                                 const string &_containerId)
    : id(genRandomAlphaNum(16)),
      channel(_channel),
      connectionCache(_connectionCache),
      registry(_registry),
      containerId(_containerId),
      workingDirectory("/") {}

void TerminalSession::reply(const string &message) { channel->send(message); }

bool TerminalSession::open() {
  if (containerId.empty()) {
    reply("Error: No container ID provided");
    channel->close();
    return false;
  }
  try {
    auto active = connectionCache->getActiveClient(*registry);
    container = active.client->get(containerId);
  } catch (const ConnectionError &ce) {
    LOG(WARNING) << "Session " << id << ": " << ce.what();
    reply(string("Error: ") + ce.what());
    channel->close();
    return false;
  } catch (const NotFoundError &nfe) {
    LOG(INFO) << "Session " << id << ": container " << containerId
              << " not found";
    reply("Error: Container " + containerId + " not found");
    channel->close();
    return false;
  } catch (const ApiError &ae) {
    reply(string("Docker API Error: ") + ae.what());
    channel->close();
    return false;
  } catch (const std::exception &e) {
    LOG(WARNING) << "Session " << id << ": cannot attach to " << containerId
                 << ": " << e.what();
    reply(string("Error: ") + e.what());
    channel->close();
    return false;
  }
  LOG(INFO) << "Session " << id << " attached to " << containerId;
  return true;
}

void TerminalSession::run() {
  el::Helpers::setThreadName("session-" + id.substr(0, 6));
  try {
    if (!open()) {
      return;
    }
    while (true) {
      string line;
      if (!channel->receive(&line)) {
        break;
      }
      if (!handleLine(line)) {
        break;
      }
    }
  } catch (const std::runtime_error &e) {
    VLOG(1) << "Session " << id << " transport ended: " << e.what();
  } catch (const std::exception &e) {
    LOG(WARNING) << "Session " << id << " failed: " << e.what();
  }
  channel->close();
  LOG(INFO) << "Session " << id << " ended";
}

bool TerminalSession::handleLine(const string &line) {
  string command = trim(line);
  if (command.empty()) {
    return true;
  }

  if (command == "help" || command == "?") {
    reply(HELP_TEXT);
  } else if (command == "exit") {
    reply("Goodbye!");
    channel->close();
    return false;
  } else if (command == "clear") {
    reply(CLEAR_SENTINEL);
  } else if (command == "pwd") {
    reply(workingDirectory);
  } else if (command == "cd" || startsWith(command, "cd ")) {
    string target = command == "cd" ? "/" : trim(command.substr(3));
    workingDirectory =
        normalizePosixPath(joinPosixPath(workingDirectory, target));
    reply("Changed directory to " + workingDirectory);
  } else if (startsWith(command, "echo ")) {
    reply(command.substr(5));
  } else if (command == "ls") {
    dispatch("ls -al " + quoteShellArgument(workingDirectory));
  } else if (startsWith(command, "ls ")) {
    dispatch("ls -al " + trim(command.substr(3)));
  } else if (startsWith(command, "cat ")) {
    dispatch("cat " + trim(command.substr(4)));
  } else {
    dispatch(command);
  }
  return true;
}

void TerminalSession::dispatch(const string &command) {
  string output;
  try {
    container->reload();
    auto result = container->exec(command, workingDirectory, true, true);
    output = decodeOutput(result.output, NO_OUTPUT_PLACEHOLDER);
  } catch (const ApiError &ae) {
    VLOG(1) << "Session " << id << " exec failed: " << ae.what();
    output = string("Docker API Error: ") + ae.what();
  } catch (const std::exception &e) {
    VLOG(1) << "Session " << id << " command failed: " << e.what();
    output = string("Error: ") + e.what();
  }
  reply(output);
}
}  // namespace ld
