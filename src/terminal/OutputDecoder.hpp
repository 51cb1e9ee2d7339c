#ifndef __LD_OUTPUT_DECODER__
#define __LD_OUTPUT_DECODER__

#include "Headers.hpp"

namespace ld {
/** @brief Shown in the terminal when a command printed nothing. */
const string NO_OUTPUT_PLACEHOLDER = "(no output)";
/** @brief Shown in log views when a container logged nothing. */
const string EMPTY_LOGS_PLACEHOLDER = "(empty)";

/**
 * @brief Decodes UTF-8, replacing each maximal invalid subsequence with
 * U+FFFD. The result is always valid UTF-8.
 */
string decodeUtf8Lossy(const string &bytes);

/**
 * @brief Treats `bytes` as markup and returns its text content: tags are
 * dropped, common entities are decoded and non-ASCII bytes become '?'.
 */
string extractPlainText(const string &bytes);

/**
 * @brief Turns raw command output into displayable text. Never throws.
 * @return `placeholder` when the decoded text is empty.
 */
string decodeOutput(const string &bytes, const string &placeholder);
}  // namespace ld

#endif  // __LD_OUTPUT_DECODER__
