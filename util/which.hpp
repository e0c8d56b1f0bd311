#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in PATH, or an empty string. A cmd containing a
// slash is returned unchanged if it is executable. Successful lookups are
// cached unless use_cache is false. Throws if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
