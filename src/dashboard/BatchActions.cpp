#include "BatchActions.hpp"

namespace ld {
optional<ContainerAction> BatchActions::parseAction(const string &name) {
  string lower = name;
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return char(tolower(c)); });
  if (lower == "start") return ContainerAction::START;
  if (lower == "stop") return ContainerAction::STOP;
  if (lower == "restart") return ContainerAction::RESTART;
  if (lower == "delete") return ContainerAction::DELETE;
  return nullopt;
}

string BatchActions::pastTense(ContainerAction action) {
  switch (action) {
    case ContainerAction::START:
      return "started";
    case ContainerAction::STOP:
      return "stopped";
    case ContainerAction::RESTART:
      return "restarted";
    case ContainerAction::DELETE:
      return "deleted";
  }
  return "";
}

BatchResult BatchActions::run(RuntimeClient &client, ContainerAction action,
                              const vector<string> &ids) {
  BatchResult result;
  result.verb = pastTense(action);
  for (const auto &id : ids) {
    string shortId = id.substr(0, 12);
    try {
      auto container = client.get(id);
      switch (action) {
        case ContainerAction::START:
          container->start();
          break;
        case ContainerAction::STOP:
          container->stop();
          break;
        case ContainerAction::RESTART:
          container->restart();
          break;
        case ContainerAction::DELETE:
          container->remove(true);
          break;
      }
      result.succeeded++;
    } catch (const NotFoundError &nfe) {
      result.errors.push_back("Container " + shortId + " not found");
    } catch (const std::runtime_error &e) {
      result.errors.push_back("Container " + shortId + ": " + e.what());
    }
  }
  LOG(INFO) << summarize(result) << ", " << result.errors.size() << " failed";
  return result;
}

string BatchActions::summarize(const BatchResult &result) {
  return to_string(result.succeeded) + " container(s) " + result.verb;
}
}  // namespace ld
