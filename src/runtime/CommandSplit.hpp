#ifndef __LD_COMMAND_SPLIT__
#define __LD_COMMAND_SPLIT__

#include "Headers.hpp"

namespace ld {
/**
 * @brief Splits a command line into argv using POSIX shell quoting rules
 * (single quotes, double quotes and backslash escapes). No expansion is
 * performed.
 *
 * @throws std::runtime_error on an unterminated quote or a trailing escape.
 */
vector<string> splitCommandLine(const string &commandLine);

/**
 * @brief Quotes `argument` so splitCommandLine() yields it back as a single
 * argument. Arguments made only of safe characters are returned as is.
 */
string quoteShellArgument(const string &argument);
}  // namespace ld

#endif  // __LD_COMMAND_SPLIT__
