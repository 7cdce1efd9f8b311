#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if the
// command cannot be found in any directory of PATH. Results are cached unless
// use_cache is false; a cached entry is dropped when the file it points to
// disappears. Thread safe.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
