#ifndef EXECUTOR_SECURITY_HPP
#define EXECUTOR_SECURITY_HPP

#include <string>
#include <vector>

#include "executor/language.hpp"

namespace executor {

// Returns a description of each risky pattern of the language that matches
// the source. Invalid patterns are logged and ignored. Blank runs are
// collapsed before matching and matches longer than about 512 characters may
// be missed.
std::vector<std::string> ScanSource(const Language& language,
                                    const std::string& source);

}  // namespace executor

#endif
