#ifndef SESSION_MODEL_HPP
#define SESSION_MODEL_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "adaptive/selector.hpp"
#include "executor/executor.hpp"

namespace session {

enum class Status {
  NOT_STARTED,
  IN_PROGRESS,
  PAUSED,
  COMPLETED,
  EXPIRED,
  TERMINATED
};

const char* StatusName(Status status);

inline bool IsTerminal(Status status) {
  return status == Status::COMPLETED || status == Status::EXPIRED ||
         status == Status::TERMINATED;
}

// Selected option ids for choice questions, free text for essays.
struct AnswerValue {
  std::vector<std::string> selected;
  std::string text;
};

struct AnswerRecord {
  std::string question_id;
  AnswerValue value;
  // False while the answer waits for manual review; is_correct is
  // meaningless then.
  bool scored = false;
  bool is_correct = false;
  double points_awarded = 0;
  int64_t submitted_at = 0;
};

struct CodeRecord {
  std::string question_id;
  std::string source_code;
  std::string language;
  int64_t submitted_at = 0;
  bool has_result = false;
  executor::ExecutionSummary last_execution_result;
};

struct ViolationRecord {
  std::string type;
  std::string severity;
  int64_t timestamp = 0;
  std::vector<std::pair<std::string, std::string>> details;
};

struct Options {
  // Zero means no time limit.
  uint32_t time_limit_seconds = 0;
  bool randomize_questions = false;
  bool randomize_options = false;
  bool adaptive = false;
  adaptive::Config adaptive_config;
  bool auto_save = true;
  bool run_all_test_cases = false;
  // Violations that terminate the session, zero to never terminate.
  uint32_t violation_threshold = 0;
  // Seed of the session random source, zero to draw one.
  uint64_t seed = 0;
};

// One candidate's attempt at a test. Timestamps are milliseconds since the
// epoch, zero when unset.
struct Session {
  std::string session_id;
  std::string candidate_id;
  std::string test_id;
  Status status = Status::NOT_STARTED;
  int64_t created_at = 0;
  int64_t started_at = 0;
  int64_t completed_at = 0;
  uint32_t current_question_index = 0;
  std::vector<std::string> question_order;
  std::map<std::string, AnswerRecord> answers;
  std::map<std::string, CodeRecord> code_submissions;
  std::vector<ViolationRecord> violations;
  int64_t last_activity_at = 0;
  int64_t last_auto_save_at = 0;
  int64_t paused_at = 0;
  // Time spent paused, excluded from the countdown.
  int64_t paused_millis = 0;
  // When the current question was served.
  int64_t presented_at = 0;
  std::string end_reason;
  Options options;
  bool has_adaptive_state = false;
  adaptive::State adaptive_state;
  double total_score = 0;
  double max_score = 0;
};

}  // namespace session

#endif
