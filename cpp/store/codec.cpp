#include "store/codec.hpp"

#include <algorithm>
#include <cstring>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

namespace {

capnproto::SessionStatus ToCapnp(session::Status status) {
  switch (status) {
    case session::Status::NOT_STARTED:
      return capnproto::SessionStatus::NOT_STARTED;
    case session::Status::IN_PROGRESS:
      return capnproto::SessionStatus::IN_PROGRESS;
    case session::Status::PAUSED:
      return capnproto::SessionStatus::PAUSED;
    case session::Status::COMPLETED:
      return capnproto::SessionStatus::COMPLETED;
    case session::Status::EXPIRED:
      return capnproto::SessionStatus::EXPIRED;
    case session::Status::TERMINATED:
      return capnproto::SessionStatus::TERMINATED;
  }
  KJ_FAIL_ASSERT("Unknown status", static_cast<int>(status));
}

session::Status FromCapnp(capnproto::SessionStatus status) {
  switch (status) {
    case capnproto::SessionStatus::NOT_STARTED:
      return session::Status::NOT_STARTED;
    case capnproto::SessionStatus::IN_PROGRESS:
      return session::Status::IN_PROGRESS;
    case capnproto::SessionStatus::PAUSED:
      return session::Status::PAUSED;
    case capnproto::SessionStatus::COMPLETED:
      return session::Status::COMPLETED;
    case capnproto::SessionStatus::EXPIRED:
      return session::Status::EXPIRED;
    case capnproto::SessionStatus::TERMINATED:
      return session::Status::TERMINATED;
  }
  KJ_FAIL_REQUIRE("Unknown status", static_cast<int>(status));
}

// The two enums share their order.
capnproto::CaseStatus ToCapnp(executor::CaseStatus status) {
  return static_cast<capnproto::CaseStatus>(status);
}

executor::CaseStatus FromCapnp(capnproto::CaseStatus status) {
  KJ_REQUIRE(static_cast<uint16_t>(status) <=
                 static_cast<uint16_t>(capnproto::CaseStatus::SKIPPED),
             "Unknown case status", static_cast<int>(status));
  return static_cast<executor::CaseStatus>(status);
}

template <typename List>
void SetTextList(List list, const std::vector<std::string>& values) {
  for (size_t i = 0; i < values.size(); i++) list.set(i, values[i]);
}

template <typename List>
std::vector<std::string> GetTextList(List list) {
  std::vector<std::string> ret;
  for (auto text : list) ret.emplace_back(text);
  return ret;
}

template <typename List>
void SetDoubleList(List list, const std::vector<double>& values) {
  for (size_t i = 0; i < values.size(); i++) list.set(i, values[i]);
}

template <typename List>
std::vector<double> GetDoubleList(List list) {
  std::vector<double> ret;
  for (double v : list) ret.push_back(v);
  return ret;
}

void ToCapnp(const executor::ExecutionSummary& summary,
             capnproto::ExecutionSummary::Builder builder) {
  builder.setLanguage(summary.language);
  builder.setCompileOutput(summary.compile_output);
  auto cases = builder.initCases(summary.cases.size());
  for (size_t i = 0; i < summary.cases.size(); i++) {
    const executor::CaseResult& result = summary.cases[i];
    auto c = cases[i];
    c.setStatus(ToCapnp(result.status));
    c.setHidden(result.hidden);
    c.setActualOutput(result.actual_output);
    c.setErrorOutput(result.error_output);
    c.setTimeMillis(result.time_millis);
    c.setMemoryKb(result.memory_kb);
    c.setExitCode(result.exit_code);
    c.setSignal(result.signal);
    c.setMessage(result.message);
  }
  builder.setPassed(summary.passed);
  builder.setExecuted(summary.executed);
  builder.setTotal(summary.total);
  SetTextList(builder.initSecurityFlags(summary.security_flags.size()),
              summary.security_flags);
  builder.setTimeMillis(summary.time_millis);
}

executor::ExecutionSummary FromCapnp(
    capnproto::ExecutionSummary::Reader reader) {
  executor::ExecutionSummary summary;
  summary.language = reader.getLanguage();
  summary.compile_output = reader.getCompileOutput();
  for (auto c : reader.getCases()) {
    executor::CaseResult result;
    result.status = FromCapnp(c.getStatus());
    result.hidden = c.getHidden();
    result.actual_output = c.getActualOutput();
    result.error_output = c.getErrorOutput();
    result.time_millis = c.getTimeMillis();
    result.memory_kb = c.getMemoryKb();
    result.exit_code = c.getExitCode();
    result.signal = c.getSignal();
    result.message = c.getMessage();
    summary.cases.push_back(std::move(result));
  }
  summary.passed = reader.getPassed();
  summary.executed = reader.getExecuted();
  summary.total = reader.getTotal();
  summary.security_flags = GetTextList(reader.getSecurityFlags());
  summary.time_millis = reader.getTimeMillis();
  return summary;
}

void ToCapnp(const adaptive::Config& config,
             capnproto::AdaptiveConfig::Builder builder) {
  builder.setInitialDifficulty(config.initial_difficulty);
  builder.setAdjustmentFactor(config.adjustment_factor);
  builder.setMinDifficulty(config.min_difficulty);
  builder.setMaxDifficulty(config.max_difficulty);
  builder.setConfidenceThreshold(config.confidence_threshold);
  builder.setMinQuestions(config.min_questions);
  builder.setMaxQuestions(config.max_questions);
}

adaptive::Config FromCapnp(capnproto::AdaptiveConfig::Reader reader) {
  adaptive::Config config;
  config.initial_difficulty = reader.getInitialDifficulty();
  config.adjustment_factor = reader.getAdjustmentFactor();
  config.min_difficulty = reader.getMinDifficulty();
  config.max_difficulty = reader.getMaxDifficulty();
  config.confidence_threshold = reader.getConfidenceThreshold();
  config.min_questions = reader.getMinQuestions();
  config.max_questions = reader.getMaxQuestions();
  return config;
}

void ToCapnp(const adaptive::State& state,
             capnproto::AdaptiveState::Builder builder) {
  builder.setAbility(state.ability);
  builder.setDifficulty(state.difficulty);
  builder.setConfidence(state.confidence);
  builder.setAnswered(state.answered);
  builder.setCorrect(state.correct);
  SetDoubleList(builder.initDifficultyHistory(state.difficulty_history.size()),
                state.difficulty_history);
  SetDoubleList(builder.initAbilityHistory(state.ability_history.size()),
                state.ability_history);
  auto history = builder.initHistory(state.history.size());
  for (size_t i = 0; i < state.history.size(); i++) {
    const adaptive::HistoryEntry& entry = state.history[i];
    history[i].setQuestionId(entry.question_id);
    history[i].setIsCorrect(entry.is_correct);
    history[i].setResponseMillis(entry.response_millis);
    history[i].setDifficulty(entry.difficulty);
    history[i].setAbilityBefore(entry.ability_before);
  }
  builder.setComplete(state.complete);
  builder.setCompletionReason(state.completion_reason);
}

adaptive::State FromCapnp(capnproto::AdaptiveState::Reader reader) {
  adaptive::State state;
  state.ability = reader.getAbility();
  state.difficulty = reader.getDifficulty();
  state.confidence = reader.getConfidence();
  state.answered = reader.getAnswered();
  state.correct = reader.getCorrect();
  state.difficulty_history = GetDoubleList(reader.getDifficultyHistory());
  state.ability_history = GetDoubleList(reader.getAbilityHistory());
  for (auto h : reader.getHistory()) {
    adaptive::HistoryEntry entry;
    entry.question_id = h.getQuestionId();
    entry.is_correct = h.getIsCorrect();
    entry.response_millis = h.getResponseMillis();
    entry.difficulty = h.getDifficulty();
    entry.ability_before = h.getAbilityBefore();
    state.history.push_back(std::move(entry));
  }
  state.complete = reader.getComplete();
  state.completion_reason = reader.getCompletionReason();
  return state;
}

void ToCapnp(const session::Options& options,
             capnproto::SessionOptions::Builder builder) {
  builder.setTimeLimitSeconds(options.time_limit_seconds);
  builder.setRandomizeQuestions(options.randomize_questions);
  builder.setRandomizeOptions(options.randomize_options);
  builder.setAdaptive(options.adaptive);
  ToCapnp(options.adaptive_config, builder.initAdaptiveConfig());
  builder.setAutoSave(options.auto_save);
  builder.setRunAllTestCases(options.run_all_test_cases);
  builder.setViolationThreshold(options.violation_threshold);
  builder.setSeed(options.seed);
}

session::Options FromCapnp(capnproto::SessionOptions::Reader reader) {
  session::Options options;
  options.time_limit_seconds = reader.getTimeLimitSeconds();
  options.randomize_questions = reader.getRandomizeQuestions();
  options.randomize_options = reader.getRandomizeOptions();
  options.adaptive = reader.getAdaptive();
  options.adaptive_config = FromCapnp(reader.getAdaptiveConfig());
  options.auto_save = reader.getAutoSave();
  options.run_all_test_cases = reader.getRunAllTestCases();
  options.violation_threshold = reader.getViolationThreshold();
  options.seed = reader.getSeed();
  return options;
}

}  // namespace

namespace store {

void ToCapnp(const session::Session& session,
             capnproto::Session::Builder builder) {
  builder.setSessionId(session.session_id);
  builder.setCandidateId(session.candidate_id);
  builder.setTestId(session.test_id);
  builder.setStatus(::ToCapnp(session.status));
  builder.setCreatedAt(session.created_at);
  builder.setStartedAt(session.started_at);
  builder.setCompletedAt(session.completed_at);
  builder.setCurrentQuestionIndex(session.current_question_index);
  SetTextList(builder.initQuestionOrder(session.question_order.size()),
              session.question_order);

  auto answers = builder.initAnswers(session.answers.size());
  size_t i = 0;
  for (const auto& kv : session.answers) {
    const session::AnswerRecord& record = kv.second;
    auto answer = answers[i++];
    answer.setQuestionId(record.question_id);
    auto value = answer.initValue();
    SetTextList(value.initSelected(record.value.selected.size()),
                record.value.selected);
    value.setText(record.value.text);
    answer.setScored(record.scored);
    answer.setIsCorrect(record.is_correct);
    answer.setPointsAwarded(record.points_awarded);
    answer.setSubmittedAt(record.submitted_at);
  }

  auto code = builder.initCodeSubmissions(session.code_submissions.size());
  i = 0;
  for (const auto& kv : session.code_submissions) {
    const session::CodeRecord& record = kv.second;
    auto submission = code[i++];
    submission.setQuestionId(record.question_id);
    submission.setSourceCode(record.source_code);
    submission.setLanguage(record.language);
    submission.setSubmittedAt(record.submitted_at);
    submission.setHasResult(record.has_result);
    if (record.has_result) {
      ::ToCapnp(record.last_execution_result,
                submission.initLastExecutionResult());
    }
  }

  auto violations = builder.initViolations(session.violations.size());
  for (i = 0; i < session.violations.size(); i++) {
    const session::ViolationRecord& record = session.violations[i];
    violations[i].setType(record.type);
    violations[i].setSeverity(record.severity);
    violations[i].setTimestamp(record.timestamp);
    auto details = violations[i].initDetails(record.details.size());
    for (size_t j = 0; j < record.details.size(); j++) {
      details[j].setKey(record.details[j].first);
      details[j].setValue(record.details[j].second);
    }
  }

  builder.setLastActivityAt(session.last_activity_at);
  builder.setLastAutoSaveAt(session.last_auto_save_at);
  builder.setPausedAt(session.paused_at);
  builder.setPausedMillis(session.paused_millis);
  builder.setPresentedAt(session.presented_at);
  builder.setEndReason(session.end_reason);
  ::ToCapnp(session.options, builder.initOptions());
  builder.setHasAdaptiveState(session.has_adaptive_state);
  if (session.has_adaptive_state) {
    ::ToCapnp(session.adaptive_state, builder.initAdaptiveState());
  }
  builder.setTotalScore(session.total_score);
  builder.setMaxScore(session.max_score);
}

session::Session FromCapnp(capnproto::Session::Reader reader) {
  session::Session session;
  session.session_id = reader.getSessionId();
  session.candidate_id = reader.getCandidateId();
  session.test_id = reader.getTestId();
  session.status = ::FromCapnp(reader.getStatus());
  session.created_at = reader.getCreatedAt();
  session.started_at = reader.getStartedAt();
  session.completed_at = reader.getCompletedAt();
  session.current_question_index = reader.getCurrentQuestionIndex();
  session.question_order = GetTextList(reader.getQuestionOrder());

  for (auto answer : reader.getAnswers()) {
    session::AnswerRecord record;
    record.question_id = answer.getQuestionId();
    record.value.selected = GetTextList(answer.getValue().getSelected());
    record.value.text = answer.getValue().getText();
    record.scored = answer.getScored();
    record.is_correct = answer.getIsCorrect();
    record.points_awarded = answer.getPointsAwarded();
    record.submitted_at = answer.getSubmittedAt();
    std::string id = record.question_id;
    session.answers[id] = std::move(record);
  }

  for (auto submission : reader.getCodeSubmissions()) {
    session::CodeRecord record;
    record.question_id = submission.getQuestionId();
    record.source_code = submission.getSourceCode();
    record.language = submission.getLanguage();
    record.submitted_at = submission.getSubmittedAt();
    record.has_result = submission.getHasResult();
    if (record.has_result) {
      record.last_execution_result =
          ::FromCapnp(submission.getLastExecutionResult());
    }
    std::string id = record.question_id;
    session.code_submissions[id] = std::move(record);
  }

  for (auto violation : reader.getViolations()) {
    session::ViolationRecord record;
    record.type = violation.getType();
    record.severity = violation.getSeverity();
    record.timestamp = violation.getTimestamp();
    for (auto detail : violation.getDetails()) {
      record.details.emplace_back(detail.getKey(), detail.getValue());
    }
    session.violations.push_back(std::move(record));
  }

  session.last_activity_at = reader.getLastActivityAt();
  session.last_auto_save_at = reader.getLastAutoSaveAt();
  session.paused_at = reader.getPausedAt();
  session.paused_millis = reader.getPausedMillis();
  session.presented_at = reader.getPresentedAt();
  session.end_reason = reader.getEndReason();
  session.options = ::FromCapnp(reader.getOptions());
  session.has_adaptive_state = reader.getHasAdaptiveState();
  if (session.has_adaptive_state) {
    session.adaptive_state = ::FromCapnp(reader.getAdaptiveState());
  }
  session.total_score = reader.getTotalScore();
  session.max_score = reader.getMaxScore();
  return session;
}

std::string Serialize(const session::Session& session, uint64_t version) {
  capnp::MallocMessageBuilder message;
  auto record = message.initRoot<capnproto::SessionRecord>();
  record.setVersion(version);
  ToCapnp(session, record.initSession());
  kj::Array<capnp::word> words = capnp::messageToFlatArray(message);
  kj::ArrayPtr<const char> bytes = words.asChars();
  return std::string(bytes.begin(), bytes.size());
}

namespace {

// The reader needs word-aligned memory.
kj::Array<capnp::word> Words(const std::string& data) {
  KJ_REQUIRE(data.size() % sizeof(capnp::word) == 0, "Truncated record",
             data.size());
  kj::Array<capnp::word> words =
      kj::heapArray<capnp::word>(data.size() / sizeof(capnp::word));
  memcpy(words.begin(), data.data(), data.size());
  return words;
}

// Records are written by this process or a trusted peer: the traversal limit
// only has to cover the largest record, which is bounded by its size.
capnp::ReaderOptions OptionsFor(const kj::Array<capnp::word>& words) {
  capnp::ReaderOptions options;
  options.traversalLimitInWords =
      std::max<uint64_t>(options.traversalLimitInWords, words.size() * 2);
  return options;
}

}  // namespace

session::Session Deserialize(const std::string& data, uint64_t* version) {
  kj::Array<capnp::word> words = Words(data);
  capnp::FlatArrayMessageReader message(words, OptionsFor(words));
  auto record = message.getRoot<capnproto::SessionRecord>();
  *version = record.getVersion();
  return FromCapnp(record.getSession());
}

uint64_t RecordVersion(const std::string& data) {
  kj::Array<capnp::word> words = Words(data);
  capnp::FlatArrayMessageReader message(words, OptionsFor(words));
  return message.getRoot<capnproto::SessionRecord>().getVersion();
}

std::string ToJson(const session::Session& session) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::Session>();
  ToCapnp(session, builder);
  capnp::JsonCodec codec;
  codec.setPrettyPrint(true);
  return codec.encode(builder.asReader()).cStr();
}

}  // namespace store
