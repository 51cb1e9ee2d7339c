#ifndef __LD_PATH_UTILS__
#define __LD_PATH_UTILS__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Lexically normalizes a POSIX path: collapses repeated separators,
 * drops `.` segments and resolves `..` against the preceding segment. `..`
 * at the root stays at the root. Relative input is treated as relative to
 * `/`.
 */
string normalizePosixPath(const string &path);

/**
 * @brief `argument` when it is absolute, otherwise `base/argument`. The
 * result is not normalized.
 */
string joinPosixPath(const string &base, const string &argument);
}  // namespace ld

#endif  // __LD_PATH_UTILS__
