#include "ReachabilityCache.hpp"

namespace ld {
ReachabilityCache::ReachabilityCache(Clock::duration _ttl, TimeSource _now)
    : ttl(_ttl), now(_now) {
  if (!now) {
    now = []() { return Clock::now(); };
  }
}

bool ReachabilityCache::isFresh(const ReachabilityEntry &entry) const {
  return now() - entry.observedAt <= ttl;
}

optional<string> ReachabilityCache::lookup(const string &containerId) const {
  string url;
  if (lookupState(containerId, &url) == ReachabilityState::REACHABLE) {
    return url;
  }
  return nullopt;
}

ReachabilityState ReachabilityCache::lookupState(const string &containerId,
                                                 string *url) const {
  lock_guard<mutex> guard(cacheMutex);
  auto it = entries.find(containerId);
  if (it == entries.end() || !isFresh(it->second)) {
    return ReachabilityState::UNKNOWN;
  }
  if (!it->second.url) {
    return ReachabilityState::UNREACHABLE;
  }
  if (url) {
    *url = *it->second.url;
  }
  return ReachabilityState::REACHABLE;
}

void ReachabilityCache::record(const string &containerId,
                               const optional<string> &url) {
  ReachabilityEntry entry;
  entry.containerId = containerId;
  entry.url = url;
  entry.observedAt = now();
  VLOG(1) << "Reachability of " << containerId << ": "
          << (url ? *url : string("unreachable"));
  lock_guard<mutex> guard(cacheMutex);
  entries[containerId] = entry;
}

optional<ReachabilityEntry> ReachabilityCache::getEntry(
    const string &containerId) const {
  lock_guard<mutex> guard(cacheMutex);
  auto it = entries.find(containerId);
  if (it == entries.end()) {
    return nullopt;
  }
  return it->second;
}

size_t ReachabilityCache::size() const {
  lock_guard<mutex> guard(cacheMutex);
  return entries.size();
}
}  // namespace ld
