#include "executor/security.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <kj/debug.h>

namespace {

// std::regex recurses once per character it consumes: matching is done on
// windows of bounded size, overlapping so that short matches are never cut.
const constexpr size_t kWindow = 2048;
const constexpr size_t kOverlap = 512;

// Every run of blank characters becomes a single space. Patterns use \s* and
// \s+ for blanks, so their matches are preserved.
std::string CollapseBlanks(const std::string& source) {
  std::string out;
  out.reserve(source.size());
  bool blank = false;
  for (char c : source) {
    if (isspace(static_cast<unsigned char>(c))) {
      if (!blank) out.push_back(' ');
      blank = true;
      continue;
    }
    blank = false;
    out.push_back(c);
  }
  return out;
}

}  // namespace

namespace executor {

std::vector<std::string> ScanSource(const Language& language,
                                    const std::string& source) {
  std::vector<std::string> flags;
  if (language.risky_patterns.empty()) return flags;
  std::string text = CollapseBlanks(source);
  for (const std::string& pattern : language.risky_patterns) {
    std::regex re;
    try {
      re.assign(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& exc) {
      KJ_LOG(WARNING, "Invalid risky pattern", language.id, pattern,
             exc.what());
      continue;
    }
    for (size_t pos = 0; pos < text.size(); pos += kWindow - kOverlap) {
      auto begin = text.cbegin() + pos;
      auto end = text.cbegin() + std::min(text.size(), pos + kWindow);
      std::smatch match;
      bool found = false;
      try {
        found = std::regex_search(
            begin, end, match, re,
            pos > 0 ? std::regex_constants::match_prev_avail
                    : std::regex_constants::match_default);
      } catch (const std::regex_error& exc) {
        KJ_LOG(WARNING, "Risky pattern too complex", language.id, pattern,
               exc.what());
        break;
      }
      if (found) {
        flags.push_back("pattern " + pattern + " matched \"" + match.str() +
                        "\"");
        break;
      }
      if (end == text.cend()) break;
    }
  }
  return flags;
}

}  // namespace executor
