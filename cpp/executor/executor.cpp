#include "executor/executor.hpp"

#include <unistd.h>
#include <algorithm>
#include <csignal>
#include <memory>
#include <thread>

#include <kj/debug.h>

#include "executor/security.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace {

static const constexpr uint64_t kMaxOutputBytes = 1 << 20;
static const constexpr uint64_t kMaxCompileOutputBytes = 64 << 10;
static const constexpr int64_t kMaxFileSizeKb = 64 * 1024;
static const constexpr int32_t kMaxFiles = 256;
// Runtimes limited through RLIMIT_DATA get this much on top of the limit of
// the submission, for the virtual machine itself.
static const constexpr uint32_t kRuntimeOverheadMb = 256;
static const constexpr char* kBoxDir = "box";

const std::vector<std::string>& Environment() {
  static const std::vector<std::string> env = {
      "PATH=/usr/local/bin:/usr/bin:/bin", "HOME=/tmp", "LANG=C.UTF-8"};
  return env;
}

// Absolute path of the program, or a path relative to the box.
std::string ResolveExecutable(const std::string& exe) {
  if (exe.find('/') != std::string::npos) return exe;
  return util::which(exe);
}

void SetLimits(const executor::Language& language, uint32_t seconds,
               uint32_t memory_mb, sandbox::ExecutionOptions* options) {
  options->cpu_limit_millis = seconds * 1000LL;
  options->wall_limit_millis = seconds * 1000LL;
  if (language.memory_limit_kind == executor::MemoryLimitKind::DATA) {
    options->data_limit_kb = (memory_mb + kRuntimeOverheadMb) * 1024LL;
  } else {
    options->memory_limit_kb = memory_mb * 1024LL;
  }
  options->max_file_size_kb = kMaxFileSizeKb;
  options->max_files = kMaxFiles;
}

// Fills the command line of options from a language command.
bool SetCommand(const executor::Command& command,
                const executor::Language& language, uint32_t memory_mb,
                const std::string& root,
                std::unique_ptr<sandbox::ExecutionOptions>* options,
                std::string* error_msg) {
  std::string exe = ResolveExecutable(command.executable);
  if (exe.empty()) {
    *error_msg = "Cannot find system program: " + command.executable;
    return false;
  }
  options->reset(new sandbox::ExecutionOptions(root, exe));
  std::vector<std::string> args;
  for (const std::string& arg : command.args) {
    args.push_back(executor::ExpandArg(arg, language.source_file, memory_mb));
  }
  (*options)->SetArgs(args);
  (*options)->SetEnv(Environment());
  return true;
}

std::string ReadOutput(const std::string& path, uint64_t limit) {
  try {
    return util::File::ReadAll(path, limit);
  } catch (const std::system_error& exc) {
    return "";
  }
}

bool HasMarker(const std::string& text,
               const std::vector<std::string>& markers) {
  for (const std::string& marker : markers) {
    if (text.find(marker) != std::string::npos) return true;
  }
  return false;
}

executor::CaseStatus Classify(const executor::Language& language,
                              const sandbox::ExecutionOptions& options,
                              const sandbox::ExecutionInfo& info,
                              int64_t memory_limit_kb,
                              const std::string& stderr_output) {
  using executor::CaseStatus;
  bool failed = info.signal != 0 || info.status_code != 0;
  int64_t cpu_millis = info.cpu_time_millis + info.sys_time_millis;
  if (info.signal == SIGXCPU ||
      (options.cpu_limit_millis && cpu_millis >= options.cpu_limit_millis) ||
      (info.killed && options.wall_limit_millis &&
       info.wall_time_millis >= options.wall_limit_millis)) {
    return CaseStatus::TIMEOUT;
  }
  if (failed && (info.memory_usage_kb >= memory_limit_kb * 8 / 10 ||
                 info.signal == SIGKILL ||
                 HasMarker(stderr_output, language.out_of_memory_markers))) {
    return CaseStatus::MEMORY_EXCEEDED;
  }
  if (failed) return CaseStatus::RUNTIME_ERROR;
  return CaseStatus::WRONG_ANSWER;
}

}  // namespace

namespace executor {

const char* CaseStatusName(CaseStatus status) {
  switch (status) {
    case CaseStatus::PASSED:
      return "passed";
    case CaseStatus::WRONG_ANSWER:
      return "wrong_answer";
    case CaseStatus::TIMEOUT:
      return "timeout";
    case CaseStatus::MEMORY_EXCEEDED:
      return "memory_exceeded";
    case CaseStatus::COMPILE_ERROR:
      return "compile_error";
    case CaseStatus::RUNTIME_ERROR:
      return "runtime_error";
    case CaseStatus::INTERNAL_ERROR:
      return "internal_error";
    case CaseStatus::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

class Executor::Slot {
 public:
  explicit Slot(Executor* executor) : executor_(executor) {
    std::unique_lock<std::mutex> lck(executor_->mutex_);
    executor_->slot_freed_.wait(
        lck, [this]() { return executor_->running_ < executor_->slots_; });
    executor_->running_++;
  }
  ~Slot() {
    {
      std::lock_guard<std::mutex> lck(executor_->mutex_);
      executor_->running_--;
    }
    executor_->slot_freed_.notify_one();
  }
  KJ_DISALLOW_COPY(Slot);

 private:
  Executor* executor_;
};

Executor::Executor(LanguageTable languages, int32_t slots)
    : languages_(std::move(languages)), slots_(slots) {
  if (slots_ <= 0) slots_ = Flags::num_cores;
  if (slots_ <= 0) slots_ = std::max(1u, std::thread::hardware_concurrency());
}

std::string Executor::NormalizeOutput(const std::string& output) {
  std::string unified;
  unified.reserve(output.size());
  for (size_t i = 0; i < output.size(); i++) {
    if (output[i] == '\r') {
      unified += '\n';
      if (i + 1 < output.size() && output[i + 1] == '\n') i++;
    } else {
      unified += output[i];
    }
  }
  std::string ret;
  size_t start = 0;
  while (start <= unified.size()) {
    size_t end = unified.find('\n', start);
    if (end == std::string::npos) end = unified.size();
    std::string line = unified.substr(start, end - start);
    line.erase(line.find_last_not_of(" \t\f\v") + 1);
    if (start) ret += '\n';
    ret += line;
    start = end + 1;
  }
  return util::lower(util::trim(ret));
}

bool Executor::RunSandbox(const sandbox::ExecutionOptions& options,
                          sandbox::ExecutionInfo* info,
                          std::string* error_msg) {
  Slot slot(this);
  std::unique_ptr<sandbox::Sandbox> box = sandbox::Sandbox::Create();
  if (!box) {
    *error_msg = "No sandbox available";
    return false;
  }
  static std::once_flag warned;
  if (!box->Isolated()) {
    std::call_once(warned, []() {
      KJ_LOG(WARNING,
             "The sandbox in use does not isolate the file system nor the "
             "network: submissions only get resource limits");
    });
  }
  return box->Execute(options, info, error_msg);
}

bool Executor::Compile(const Language& language, const std::string& dir,
                       ExecutionSummary* summary) {
  auto fail = [summary](const std::string& message) {
    for (CaseResult& result : summary->cases) {
      result.status = CaseStatus::COMPILE_ERROR;
      result.message = message;
    }
    return false;
  };
  std::unique_ptr<sandbox::ExecutionOptions> options;
  std::string error_msg;
  if (!SetCommand(language.compile, language,
                  language.compile_memory_limit_mb, dir, &options,
                  &error_msg)) {
    return fail(error_msg);
  }
  SetLimits(language, language.compile_time_limit_seconds,
            language.compile_memory_limit_mb, options.get());
  options->allow_fork = true;
  options->writable_root = true;
  std::string out = util::File::JoinPath(util::File::BaseDir(dir), "compile");
  sandbox::ExecutionOptions::stringcpy(options->stdout_file, out + ".stdout");
  sandbox::ExecutionOptions::stringcpy(options->stderr_file, out + ".stderr");

  sandbox::ExecutionInfo info;
  if (!RunSandbox(*options, &info, &error_msg)) {
    KJ_LOG(WARNING, "Compilation could not start", language.id, error_msg);
    return fail(error_msg);
  }
  summary->compile_output =
      ReadOutput(out + ".stdout", kMaxCompileOutputBytes) +
      ReadOutput(out + ".stderr", kMaxCompileOutputBytes);
  if (info.status_code != 0 || info.signal != 0) {
    if (info.killed) return fail("Compilation time limit exceeded");
    return fail(info.message);
  }
  return true;
}

CaseResult Executor::RunCase(const Language& language,
                             const ExecutionRequest& request,
                             const TestCase& test_case,
                             const std::string& prepared) {
  CaseResult result;
  result.hidden = test_case.hidden;
  uint32_t seconds = request.time_limit_seconds
                         ? request.time_limit_seconds
                         : language.time_limit_seconds;
  uint32_t memory_mb = request.memory_limit_mb ? request.memory_limit_mb
                                               : language.memory_limit_mb;

  util::TempDir tmp(Flags::temp_directory);
  if (Flags::keep_sandboxes) tmp.Keep();
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box);
  for (const std::string& file : util::File::ListFiles(prepared)) {
    std::string dest =
        util::File::JoinPath(box, file.substr(prepared.size() + 1));
    util::File::HardCopy(file, dest, true, true, true);
    if (access(file.c_str(), X_OK) == 0) util::File::MakeExecutable(dest);
  }
  std::string stdin_path = util::File::JoinPath(tmp.Path(), "stdin");
  std::string stdout_path = util::File::JoinPath(tmp.Path(), "stdout");
  std::string stderr_path = util::File::JoinPath(tmp.Path(), "stderr");
  util::File::WriteAll(stdin_path, test_case.input);

  std::unique_ptr<sandbox::ExecutionOptions> options;
  std::string error_msg;
  if (!SetCommand(language.run, language, memory_mb, box, &options,
                  &error_msg)) {
    result.status = CaseStatus::INTERNAL_ERROR;
    result.message = error_msg;
    return result;
  }
  SetLimits(language, seconds, memory_mb, options.get());
  sandbox::ExecutionOptions::stringcpy(options->stdin_file, stdin_path);
  sandbox::ExecutionOptions::stringcpy(options->stdout_file, stdout_path);
  sandbox::ExecutionOptions::stringcpy(options->stderr_file, stderr_path);

  sandbox::ExecutionInfo info;
  if (!RunSandbox(*options, &info, &error_msg)) {
    KJ_LOG(WARNING, "Sandbox failed", language.id, error_msg);
    result.status = CaseStatus::INTERNAL_ERROR;
    result.message = error_msg;
    return result;
  }
  result.actual_output = ReadOutput(stdout_path, kMaxOutputBytes);
  result.error_output = ReadOutput(stderr_path, kMaxOutputBytes);
  result.time_millis = info.wall_time_millis;
  result.memory_kb = info.memory_usage_kb;
  result.exit_code = info.status_code;
  result.signal = info.signal;
  result.message = info.message;

  result.status = Classify(language, *options, info, memory_mb * 1024LL,
                           result.error_output);
  if (result.status == CaseStatus::WRONG_ANSWER &&
      NormalizeOutput(result.actual_output) ==
          NormalizeOutput(test_case.expected_output)) {
    result.status = CaseStatus::PASSED;
  }
  return result;
}

ExecutionSummary Executor::Execute(const ExecutionRequest& request) {
  ExecutionSummary summary;
  summary.language = request.language;
  summary.total = request.cases.size();
  summary.cases.resize(request.cases.size());
  for (size_t i = 0; i < request.cases.size(); i++) {
    summary.cases[i].hidden = request.cases[i].hidden;
  }
  auto internal_error = [&summary](const std::string& message) {
    for (CaseResult& result : summary.cases) {
      if (result.status != CaseStatus::SKIPPED) continue;
      result.status = CaseStatus::INTERNAL_ERROR;
      result.message = message;
    }
  };

  const Language* language = languages_.Find(request.language);
  if (language == nullptr) {
    internal_error("Unsupported language: " + request.language);
    return summary;
  }
  if (request.source.size() > kMaxSourceBytes) {
    KJ_LOG(WARNING, "Submission too large", language->id,
           request.source.size());
    internal_error("Source code larger than " +
                   std::to_string(kMaxSourceBytes) + " bytes");
    return summary;
  }
  summary.security_flags = ScanSource(*language, request.source);
  for (const std::string& flag : summary.security_flags) {
    KJ_LOG(WARNING, "Risky construct in submission", language->id, flag);
  }
  KJ_LOG(INFO, "Executing submission", language->id, summary.total);

  try {
    util::TempDir work(Flags::temp_directory);
    if (Flags::keep_sandboxes) work.Keep();
    std::string prepared = util::File::JoinPath(work.Path(), "prepared");
    util::File::MakeDirs(prepared);
    util::File::WriteAll(util::File::JoinPath(prepared, language->source_file),
                         request.source);
    if (language->Compiled() && !Compile(*language, prepared, &summary)) {
      KJ_LOG(INFO, "Compilation failed", language->id);
      return summary;
    }
    bool stop = false;
    for (size_t i = 0; i < request.cases.size() && !stop; i++) {
      CaseResult& result = summary.cases[i];
      result = RunCase(*language, request, request.cases[i], prepared);
      summary.executed++;
      summary.time_millis += result.time_millis;
      if (result.Passed()) {
        summary.passed++;
      } else if (!result.hidden && !request.run_all_cases) {
        stop = true;
      }
    }
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.what());
    internal_error(exc.what());
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.getDescription());
    internal_error(exc.getDescription().cStr());
  }
  KJ_LOG(INFO, "Submission executed", language->id, summary.passed,
         summary.executed, summary.total);
  return summary;
}

}  // namespace executor
