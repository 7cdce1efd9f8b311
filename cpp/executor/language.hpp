#ifndef EXECUTOR_LANGUAGE_HPP
#define EXECUTOR_LANGUAGE_HPP

#include <map>
#include <string>
#include <vector>

namespace executor {

// A command line. Arguments may contain the placeholders {source}, {memory}
// (memory limit in megabytes) and {stack}.
struct Command {
  std::string executable;
  std::vector<std::string> args;

  bool empty() const { return executable.empty(); }
};

enum class MemoryLimitKind { ADDRESS_SPACE, DATA };

// How submissions in a language are compiled and run.
struct Language {
  std::string id;
  // Name the submission is saved as inside the box.
  std::string source_file;
  // Empty for interpreted languages.
  Command compile;
  Command run;
  uint32_t time_limit_seconds = 30;
  uint32_t memory_limit_mb = 128;
  uint32_t compile_time_limit_seconds = 30;
  uint32_t compile_memory_limit_mb = 512;
  MemoryLimitKind memory_limit_kind = MemoryLimitKind::ADDRESS_SPACE;
  // Regular expressions of constructs worth an audit flag.
  std::vector<std::string> risky_patterns;
  // Substrings of stderr telling that the runtime ran out of memory.
  std::vector<std::string> out_of_memory_markers;

  bool Compiled() const { return !compile.empty(); }
};

// The set of languages the executor accepts, keyed by id.
class LanguageTable {
 public:
  // Python, JavaScript, Java, C++ and C.
  static LanguageTable Default();

  // Reads a JSON document shaped like capnproto::LanguageTable. Throws
  // kj::Exception on malformed input.
  static LanguageTable FromJson(const std::string& json);
  static LanguageTable Load(const std::string& path);

  // Adds or replaces a language.
  void Add(Language language);

  // Returns nullptr for unknown languages.
  const Language* Find(const std::string& id) const;

  std::vector<std::string> Ids() const;

 private:
  std::map<std::string, Language> languages_;
};

// Replaces the placeholders of a command argument.
std::string ExpandArg(const std::string& arg, const std::string& source,
                      uint32_t memory_mb);

}  // namespace executor

#endif
