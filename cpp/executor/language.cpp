#include "executor/language.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/config.capnp.h"
#include "util/file.hpp"

namespace {

executor::Command FromCapnp(capnproto::Command::Reader command) {
  executor::Command ret;
  ret.executable = command.getExecutable();
  for (auto arg : command.getArgs()) ret.args.emplace_back(arg);
  return ret;
}

executor::Language FromCapnp(capnproto::Language::Reader language) {
  executor::Language ret;
  ret.id = language.getId();
  KJ_REQUIRE(!ret.id.empty(), "Language without id");
  ret.source_file = language.getSourceFile();
  KJ_REQUIRE(!ret.source_file.empty(), "Language without source file",
             ret.id);
  ret.compile = FromCapnp(language.getCompile());
  ret.run = FromCapnp(language.getRun());
  KJ_REQUIRE(!ret.run.empty(), "Language without run command", ret.id);
  if (language.getTimeLimitSeconds()) {
    ret.time_limit_seconds = language.getTimeLimitSeconds();
  }
  if (language.getMemoryLimitMb()) {
    ret.memory_limit_mb = language.getMemoryLimitMb();
  }
  if (language.getCompileTimeLimitSeconds()) {
    ret.compile_time_limit_seconds = language.getCompileTimeLimitSeconds();
  }
  if (language.getCompileMemoryLimitMb()) {
    ret.compile_memory_limit_mb = language.getCompileMemoryLimitMb();
  }
  ret.memory_limit_kind =
      language.getMemoryLimitKind() == capnproto::MemoryLimitKind::DATA
          ? executor::MemoryLimitKind::DATA
          : executor::MemoryLimitKind::ADDRESS_SPACE;
  for (auto pattern : language.getRiskyPatterns()) {
    ret.risky_patterns.emplace_back(pattern);
  }
  for (auto marker : language.getOutOfMemoryMarkers()) {
    ret.out_of_memory_markers.emplace_back(marker);
  }
  return ret;
}

}  // namespace

namespace executor {

LanguageTable LanguageTable::Default() {
  LanguageTable table;

  Language python;
  python.id = "python";
  python.source_file = "main.py";
  python.run = {"python3", {"{source}"}};
  python.risky_patterns = {
      R"(\bimport\s+(os|subprocess|socket|ctypes|shutil)\b)",
      R"(\bfrom\s+(os|subprocess|socket|ctypes|shutil)\s+import\b)",
      R"(\b(eval|exec|compile|__import__)\s*\()",
      R"(\bopen\s*\()"};
  python.out_of_memory_markers = {"MemoryError"};
  table.Add(python);

  Language javascript;
  javascript.id = "javascript";
  javascript.source_file = "main.js";
  javascript.run = {"node", {"--max-old-space-size={memory}", "{source}"}};
  javascript.memory_limit_kind = MemoryLimitKind::DATA;
  javascript.risky_patterns = {
      R"(\brequire\s*\(\s*['"](child_process|fs|net|http|https|vm|os)['"])",
      R"(\bprocess\.(exit|kill|binding)\b)", R"(\beval\s*\()",
      R"(\bnew\s+Function\s*\()"};
  javascript.out_of_memory_markers = {"heap out of memory",
                                      "Allocation failed"};
  table.Add(javascript);

  Language java;
  java.id = "java";
  java.source_file = "Main.java";
  java.compile = {"javac", {"-J-Xmx{memory}m", "-encoding", "UTF-8",
                            "{source}"}};
  java.run = {"java",
              {"-Xmx{memory}m", "-Xss64m", "-XX:+UseSerialGC",
               "-XX:TieredStopAtLevel=1", "-cp", ".", "Main"}};
  java.time_limit_seconds = 45;
  java.memory_limit_mb = 256;
  java.compile_memory_limit_mb = 1024;
  java.memory_limit_kind = MemoryLimitKind::DATA;
  java.risky_patterns = {R"(\bRuntime\s*\.\s*getRuntime\s*\(\s*\)\s*\.\s*exec)",
                         R"(\bProcessBuilder\b)", R"(\bjava\.net\.)",
                         R"(\bjava\.lang\.reflect\.)", R"(\bSystem\.exit\s*\()"};
  java.out_of_memory_markers = {"java.lang.OutOfMemoryError"};
  table.Add(java);

  Language cpp;
  cpp.id = "cpp";
  cpp.source_file = "main.cpp";
  cpp.compile = {"g++", {"-O2", "-std=c++17", "-o", "main", "{source}"}};
  cpp.run = {"./main", {}};
  cpp.time_limit_seconds = 45;
  cpp.risky_patterns = {R"(\b(system|popen|fork|execv[pe]?|execl[pe]?)\s*\()",
                        R"(#\s*include\s*<(sys/socket|netinet/in|unistd)\.h>)",
                        R"(\basm\b|__asm__)"};
  cpp.out_of_memory_markers = {"std::bad_alloc"};
  table.Add(cpp);

  Language c = cpp;
  c.id = "c";
  c.source_file = "main.c";
  c.compile = {"gcc", {"-O2", "-std=c11", "-o", "main", "{source}", "-lm"}};
  c.out_of_memory_markers.clear();
  table.Add(c);

  return table;
}

LanguageTable LanguageTable::FromJson(const std::string& json) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::LanguageTable>();
  codec.decode(kj::StringPtr(json.c_str(), json.size()), root);
  LanguageTable table;
  for (auto language : root.asReader().getLanguages()) {
    table.Add(FromCapnp(language));
  }
  return table;
}

LanguageTable LanguageTable::Load(const std::string& path) {
  KJ_LOG(INFO, "Loading languages", path);
  return FromJson(util::File::ReadAll(path));
}

void LanguageTable::Add(Language language) {
  std::string id = language.id;
  languages_[id] = std::move(language);
}

const Language* LanguageTable::Find(const std::string& id) const {
  auto it = languages_.find(id);
  if (it == languages_.end()) return nullptr;
  return &it->second;
}

std::vector<std::string> LanguageTable::Ids() const {
  std::vector<std::string> ids;
  for (const auto& kv : languages_) ids.push_back(kv.first);
  return ids;
}

std::string ExpandArg(const std::string& arg, const std::string& source,
                      uint32_t memory_mb) {
  std::string ret;
  size_t pos = 0;
  while (pos < arg.size()) {
    size_t open = arg.find('{', pos);
    size_t close =
        open == std::string::npos ? std::string::npos : arg.find('}', open);
    if (close == std::string::npos) {
      ret += arg.substr(pos);
      break;
    }
    ret += arg.substr(pos, open - pos);
    std::string name = arg.substr(open + 1, close - open - 1);
    if (name == "source") {
      ret += source;
    } else if (name == "memory" || name == "stack") {
      ret += std::to_string(memory_mb);
    } else {
      ret += arg.substr(open, close - open + 1);
    }
    pos = close + 1;
  }
  return ret;
}

}  // namespace executor
