#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "executor/language.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

struct TestCase {
  std::string input;
  std::string expected_output;
  bool hidden = false;
};

enum class CaseStatus {
  PASSED,
  WRONG_ANSWER,
  TIMEOUT,
  MEMORY_EXCEEDED,
  COMPILE_ERROR,
  RUNTIME_ERROR,
  INTERNAL_ERROR,
  SKIPPED
};

const char* CaseStatusName(CaseStatus status);

struct CaseResult {
  CaseStatus status = CaseStatus::SKIPPED;
  bool hidden = false;
  std::string actual_output;
  std::string error_output;
  int64_t time_millis = 0;
  int64_t memory_kb = 0;
  int32_t exit_code = 0;
  int32_t signal = 0;
  std::string message;

  bool Passed() const { return status == CaseStatus::PASSED; }
  bool Executed() const {
    return status != CaseStatus::SKIPPED &&
           status != CaseStatus::COMPILE_ERROR;
  }
};

struct ExecutionSummary {
  std::string language;
  std::string compile_output;
  // One entry per test case of the request, in order.
  std::vector<CaseResult> cases;
  uint32_t passed = 0;
  // Cases that actually ran.
  uint32_t executed = 0;
  uint32_t total = 0;
  // Risky constructs found in the source. They never block execution.
  std::vector<std::string> security_flags;
  int64_t time_millis = 0;

  bool AllPassed() const { return total > 0 && passed == total; }
};

struct ExecutionRequest {
  std::string language;
  std::string source;
  std::vector<TestCase> cases;
  // Zero means the default of the language.
  uint32_t time_limit_seconds = 0;
  uint32_t memory_limit_mb = 0;
  // Keep running after the first failed visible case.
  bool run_all_cases = false;
};

// Runs untrusted submissions against test cases, one fresh sandbox per case.
// Thread safe: at most `slots` sandboxes run at the same time.
class Executor {
 public:
  // Larger sources are refused without running.
  static const constexpr size_t kMaxSourceBytes = 256 << 10;

  // slots <= 0 means Flags::num_cores, or the number of CPUs if that is
  // unset too.
  explicit Executor(LanguageTable languages, int32_t slots = 0);
  KJ_DISALLOW_COPY(Executor);

  bool Supports(const std::string& language) const {
    return languages_.Find(language) != nullptr;
  }

  const LanguageTable& Languages() const { return languages_; }

  // Never throws: failures are reported as case statuses. An unsupported
  // language or a source over kMaxSourceBytes yields INTERNAL_ERROR for
  // every case.
  ExecutionSummary Execute(const ExecutionRequest& request);

  // Line endings unified, trailing whitespace of every line and surrounding
  // blank space removed, lower case.
  static std::string NormalizeOutput(const std::string& output);

 private:
  class Slot;

  // Compiles the source in place. On failure fills every case of summary
  // with COMPILE_ERROR and returns false.
  bool Compile(const Language& language, const std::string& dir,
               ExecutionSummary* summary);

  CaseResult RunCase(const Language& language, const ExecutionRequest& request,
                     const TestCase& test_case, const std::string& prepared);

  // Runs one sandbox, waiting for a free slot first.
  bool RunSandbox(const sandbox::ExecutionOptions& options,
                  sandbox::ExecutionInfo* info, std::string* error_msg);

  LanguageTable languages_;
  int32_t slots_;
  int32_t running_ = 0;
  std::mutex mutex_;
  std::condition_variable slot_freed_;
};

}  // namespace executor

#endif
