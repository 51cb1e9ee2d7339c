#ifndef __LD_REACHABILITY_CACHE__
#define __LD_REACHABILITY_CACHE__

#include "Headers.hpp"

namespace ld {
enum class ReachabilityState { UNKNOWN, REACHABLE, UNREACHABLE };

struct ReachabilityEntry {
  string containerId;
  /** @brief Absent means the container was checked and nothing answered. */
  optional<string> url;
  chrono::steady_clock::time_point observedAt;
};

/**
 * @brief Last known reachable URL per container, trusted for a fixed TTL.
 *
 * Stale entries are kept until overwritten; lookups simply ignore them.
 * Safe for concurrent readers and writers.
 */
class ReachabilityCache {
 public:
  typedef chrono::steady_clock Clock;
  typedef function<Clock::time_point()> TimeSource;

  /**
   * @param _now Clock used for both writes and reads; the steady clock when
   * empty.
   */
  explicit ReachabilityCache(Clock::duration _ttl = chrono::seconds(30),
                             TimeSource _now = TimeSource());

  /**
   * @brief The cached URL when a fresh positive entry exists. Never touches
   * the network.
   */
  optional<string> lookup(const string &containerId) const;

  /**
   * @brief Distinguishes a fresh negative entry from a missing or stale one.
   * @param url Receives the URL for REACHABLE, may be null.
   */
  ReachabilityState lookupState(const string &containerId,
                                string *url = NULL) const;

  /** @brief Stores a probe result observed now. */
  void record(const string &containerId, const optional<string> &url);

  /** @brief The raw entry, fresh or stale. */
  optional<ReachabilityEntry> getEntry(const string &containerId) const;

  Clock::duration getTtl() const { return ttl; }

  size_t size() const;

 protected:
  bool isFresh(const ReachabilityEntry &entry) const;

  Clock::duration ttl;
  TimeSource now;
  unordered_map<string, ReachabilityEntry> entries;
  mutable mutex cacheMutex;
};
}  // namespace ld

#endif  // __LD_REACHABILITY_CACHE__
