#ifndef __LD_HTTP_PROBER__
#define __LD_HTTP_PROBER__

#include "Headers.hpp"

namespace ld {
enum class ProbeOutcome { REACHABLE, UNREACHABLE, ERROR };

/**
 * @brief Checks whether a single host:port answers HTTP.
 *
 * Implementations report failures through ProbeOutcome and never throw.
 */
class HttpProber {
 public:
  virtual ~HttpProber() {}

  virtual ProbeOutcome probe(const string &host, int port,
                             double timeoutSeconds) = 0;
};

/**
 * @brief Sends `HEAD /`, falling back to `GET /`. Any status below 400
 * counts as reachable.
 */
class HttplibProber : public HttpProber {
 public:
  ProbeOutcome probe(const string &host, int port,
                     double timeoutSeconds) override;
};
}  // namespace ld

#endif  // __LD_HTTP_PROBER__
