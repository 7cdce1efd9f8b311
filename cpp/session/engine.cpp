#include "session/engine.hpp"

#include <algorithm>
#include <set>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace {

const constexpr char* kHexDigits = "0123456789abcdef";
const constexpr size_t kSessionIdLength = 32;

const constexpr char* kCompleted = "completed";
const constexpr char* kAllQuestionsAnswered = "all_questions_answered";
const constexpr char* kPoolExhausted = "question_pool_exhausted";
const constexpr char* kTimeLimitExceeded = "time_limit_exceeded";
const constexpr char* kTerminated = "terminated";
const constexpr char* kViolationThresholdExceeded =
    "violation_threshold_exceeded";
const constexpr char* kMaximumQuestionsReached = "maximum_questions_reached";

// Bytes of each output kept in recorded execution results.
const constexpr size_t kMaxRecordedOutput = 4096;
const constexpr char* kClipped = "\n[output clipped]";

void Clip(std::string* output) {
  if (output->size() <= kMaxRecordedOutput) return;
  output->resize(kMaxRecordedOutput);
  output->append(kClipped);
}

executor::ExecutionSummary ForRecord(executor::ExecutionSummary summary) {
  Clip(&summary.compile_output);
  for (executor::CaseResult& result : summary.cases) {
    Clip(&result.actual_output);
    Clip(&result.error_output);
  }
  return summary;
}

}  // namespace

namespace session {

Engine::Engine(const catalog::QuestionCatalog* catalog,
               store::SessionStore* store, executor::Executor* executor,
               EngineOptions options)
    : catalog_(catalog),
      store_(store),
      executor_(executor),
      clock_(options.clock ? options.clock : util::Clock::System()),
      autosave_interval_millis_(options.autosave_interval_millis > 0
                                    ? options.autosave_interval_millis
                                    : Flags::autosave_interval_millis),
      busy_retry_millis_(options.busy_retry_millis),
      sweep_interval_millis_(options.sweep_interval_millis != 0
                                 ? options.sweep_interval_millis
                                 : Flags::sweep_interval_millis),
      retention_millis_(std::max<int64_t>(0, options.terminal_retention_millis)),
      ids_(util::Random::RandomSeed()) {
  if (sweep_interval_millis_ > 0) {
    ScheduleSweep(sweep_interval_millis_, /*scan_store=*/true);
  }
}

Engine::~Engine() {
  stopping_ = true;
  scheduler_.Cancel(sweep_task_.exchange(0));
  std::vector<EntryPtr> entries;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (const auto& kv : entries_) entries.push_back(kv.second);
  }
  for (const EntryPtr& entry : entries) {
    std::lock_guard<std::mutex> lck(entry->mutex);
    CancelAutoSave(entry.get());
    if (entry->revision == entry->saved_revision) continue;
    try {
      Save(entry.get(), true);
    } catch (const std::exception& exc) {
      KJ_LOG(ERROR, "Final save failed", entry->session.session_id,
             exc.what());
    } catch (const kj::Exception& exc) {
      KJ_LOG(ERROR, "Final save failed", entry->session.session_id,
             exc.getDescription());
    }
  }
}

Engine::EntryPtr Engine::MakeEntry(Session session, uint64_t version) {
  const auto* questions = catalog_->GetQuestionsForTest(session.test_id);
  if (questions == nullptr || questions->empty()) {
    throw SessionError(ErrorCode::INVALID_TEST,
                       "Unknown or empty test " + session.test_id);
  }
  auto entry = std::make_shared<Entry>();
  entry->questions = questions;
  for (const catalog::Question& question : *questions) {
    entry->index[question.id] = &question;
  }
  // A reloaded session continues with a different stream.
  entry->random.reset(new util::Random(session.options.seed ^ version));
  entry->session = std::move(session);
  entry->version = version;
  return entry;
}

Engine::EntryPtr Engine::Find(const std::string& session_id) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = entries_.find(session_id);
    if (it != entries_.end()) return it->second;
  }
  store::StoredSession stored;
  if (!store_->Get(session_id, &stored)) {
    throw SessionError(ErrorCode::INVALID_SESSION,
                       "No session " + session_id);
  }
  EntryPtr entry = MakeEntry(std::move(stored.session), stored.version);
  std::lock_guard<std::mutex> lck(mutex_);
  auto inserted = entries_.emplace(session_id, entry);
  if (!inserted.second) return inserted.first->second;
  KJ_LOG(INFO, "Session recovered", session_id, stored.version,
         StatusName(entry->session.status));
  if (entry->session.status == Status::IN_PROGRESS &&
      entry->session.options.auto_save) {
    ScheduleAutoSave(entry, autosave_interval_millis_);
  } else if (IsTerminal(entry->session.status)) {
    ScheduleEviction(session_id, retention_millis_);
  }
  return entry;
}

std::string Engine::NewSessionId() {
  while (true) {
    std::string id;
    {
      std::lock_guard<std::mutex> lck(mutex_);
      for (size_t i = 0; i < kSessionIdLength; i++) {
        id += kHexDigits[ids_.Below(16)];
      }
      if (entries_.count(id)) continue;
    }
    store::StoredSession stored;
    if (!store_->Get(id, &stored)) return id;
  }
}

void Engine::LoadOpenSessions() {
  for (const std::string& id : store_->List()) {
    store::StoredSession stored;
    if (!store_->Get(id, &stored)) continue;
    const Session& session = stored.session;
    if (IsTerminal(session.status)) continue;
    open_sessions_[std::make_pair(session.candidate_id, session.test_id)] = id;
  }
  open_sessions_loaded_ = true;
  KJ_LOG(INFO, "Open sessions indexed", open_sessions_.size());
}

std::string Engine::FindOpenSession(const std::string& candidate_id,
                                    const std::string& test_id) {
  if (!open_sessions_loaded_) LoadOpenSessions();
  auto it = open_sessions_.find(std::make_pair(candidate_id, test_id));
  if (it == open_sessions_.end()) return "";
  EntryPtr entry;
  try {
    entry = Find(it->second);
  } catch (const SessionError& exc) {
    KJ_LOG(WARNING, "Indexed session cannot be loaded", it->second,
           exc.what());
    open_sessions_.erase(it);
    return "";
  }
  std::lock_guard<std::mutex> lck(entry->mutex);
  if (IsTerminal(entry->session.status)) {
    open_sessions_.erase(it);
    return "";
  }
  return it->second;
}

std::string Engine::CreateSession(const std::string& candidate_id,
                                  const std::string& test_id,
                                  Options options) {
  KJ_REQUIRE(!candidate_id.empty(), "Missing candidate id");
  if (options.adaptive) {
    const adaptive::Config& config = options.adaptive_config;
    KJ_REQUIRE(config.max_questions > 0, "Adaptive tests ask something");
    KJ_REQUIRE(config.min_difficulty <= config.max_difficulty,
               config.min_difficulty, config.max_difficulty);
  }
  std::lock_guard<std::mutex> create_lck(create_mutex_);
  std::string existing = FindOpenSession(candidate_id, test_id);
  if (!existing.empty()) {
    KJ_LOG(INFO, "Reusing open session", existing, candidate_id, test_id);
    return existing;
  }
  while (options.seed == 0) options.seed = util::Random::RandomSeed();

  Session session;
  session.session_id = NewSessionId();
  session.candidate_id = candidate_id;
  session.test_id = test_id;
  session.created_at = clock_->NowMillis();
  session.last_activity_at = session.created_at;
  session.options = options;
  EntryPtr entry = MakeEntry(std::move(session), 0);
  {
    std::lock_guard<std::mutex> lck(entry->mutex);
    Save(entry.get(), false);
  }
  const std::string& id = entry->session.session_id;
  open_sessions_[std::make_pair(candidate_id, test_id)] = id;
  std::lock_guard<std::mutex> lck(mutex_);
  entries_[id] = entry;
  KJ_LOG(INFO, "Session created", id, candidate_id, test_id);
  return id;
}

int64_t Engine::ActiveMillis(const Session& session, int64_t now) const {
  if (session.started_at == 0) return 0;
  int64_t end = IsTerminal(session.status) ? session.completed_at : now;
  int64_t active = end - session.started_at - session.paused_millis;
  if (session.status == Status::PAUSED) active -= end - session.paused_at;
  return std::max<int64_t>(0, active);
}

bool Engine::Overdue(const Session& session, int64_t now) const {
  return session.status == Status::IN_PROGRESS &&
         session.options.time_limit_seconds > 0 &&
         ActiveMillis(session, now) >
             static_cast<int64_t>(session.options.time_limit_seconds) * 1000;
}

bool Engine::ExpireIfOverdue(Entry* entry, int64_t now) {
  if (!Overdue(entry->session, now)) return false;
  if (entry->running_submissions > 0) return false;
  Finish(entry, Status::EXPIRED, kTimeLimitExceeded, now);
  return true;
}

void Engine::CheckOpen(Entry* entry, int64_t now) {
  const Session& session = entry->session;
  if (IsTerminal(session.status)) {
    throw SessionError(ErrorCode::SESSION_CLOSED,
                       "Session " + session.session_id + " is " +
                           StatusName(session.status),
                       Result(entry));
  }
  if (Overdue(session, now)) {
    ExpireIfOverdue(entry, now);
    throw SessionError(ErrorCode::SESSION_EXPIRED,
                       "Session " + session.session_id + " ran out of time",
                       Result(entry));
  }
}

void Engine::RequireInProgress(const Entry& entry, const char* operation) {
  const Session& session = entry.session;
  if (session.status != Status::IN_PROGRESS) {
    throw SessionError(ErrorCode::INVALID_STATE,
                       std::string(operation) + " on session " +
                           session.session_id + " which is " +
                           StatusName(session.status));
  }
}

adaptive::Selector Engine::SelectorFor(const Session& session) const {
  return adaptive::Selector(session.options.adaptive_config);
}

void Engine::Start(Entry* entry, int64_t now) {
  Session& session = entry->session;
  session.status = Status::IN_PROGRESS;
  session.started_at = now;
  if (session.options.adaptive) {
    session.has_adaptive_state = true;
    session.adaptive_state = SelectorFor(session).Initialize();
  } else {
    session.question_order =
        OrderQuestions(*entry->questions, session.options.randomize_questions,
                       entry->random.get());
  }
  session.max_score = MaxScore(session, entry->index);
  Touch(entry, now);
  KJ_LOG(INFO, "Session started", session.session_id,
         session.question_order.size(), session.options.adaptive);
}

void Engine::Finish(Entry* entry, Status status, const std::string& reason,
                    int64_t now) {
  Session& session = entry->session;
  if (session.status == Status::PAUSED) {
    session.paused_millis += now - session.paused_at;
    session.paused_at = 0;
  }
  session.status = status;
  session.end_reason = reason;
  session.completed_at = now;
  if (session.has_adaptive_state && !session.adaptive_state.complete) {
    session.adaptive_state.complete = true;
    session.adaptive_state.completion_reason = reason;
  }
  CancelAutoSave(entry);
  Touch(entry, now);
  Save(entry, false);
  ScheduleEviction(session.session_id, retention_millis_);
  KJ_LOG(INFO, "Session ended", session.session_id, StatusName(status),
         reason, session.total_score, session.max_score);
}

const catalog::Question& Engine::QuestionFor(Entry* entry,
                                             const std::string& question_id) {
  const Session& session = entry->session;
  auto it = entry->index.find(question_id);
  if (it == entry->index.end() ||
      std::find(session.question_order.begin(), session.question_order.end(),
                question_id) == session.question_order.end()) {
    throw SessionError(ErrorCode::QUESTION_NOT_FOUND,
                       "Question " + question_id + " is not part of session " +
                           session.session_id);
  }
  return *it->second;
}

bool Engine::GetNextQuestion(const std::string& session_id,
                             NextQuestion* next) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  Session& session = entry->session;
  bool started = false;
  if (session.status == Status::NOT_STARTED) {
    Start(entry.get(), now);
    started = true;
  }
  RequireInProgress(*entry, "getNextQuestion");

  const catalog::Question* question = nullptr;
  uint32_t index = session.current_question_index;
  if (session.has_adaptive_state) {
    const adaptive::State& state = session.adaptive_state;
    if (state.complete) {
      // Decided by an answer recorded while the session was paused.
      Finish(entry.get(), Status::COMPLETED, state.completion_reason, now);
      return false;
    }
    if (index < session.question_order.size()) {
      question = &QuestionFor(entry.get(), session.question_order[index]);
    } else if (session.question_order.size() >=
               session.options.adaptive_config.max_questions) {
      Finish(entry.get(), Status::COMPLETED, kMaximumQuestionsReached, now);
      return false;
    } else {
      std::set<std::string> asked(session.question_order.begin(),
                                  session.question_order.end());
      question = SelectorFor(session).SelectNext(session.adaptive_state,
                                                 *entry->questions, asked);
      if (question == nullptr) {
        Finish(entry.get(), Status::COMPLETED, kPoolExhausted, now);
        return false;
      }
      session.question_order.push_back(question->id);
      session.max_score = MaxScore(session, entry->index);
    }
  } else {
    if (index >= session.question_order.size()) {
      Finish(entry.get(), Status::COMPLETED, kAllQuestionsAnswered, now);
      return false;
    }
    question = &QuestionFor(entry.get(), session.question_order[index]);
  }
  session.presented_at = now;
  Touch(entry.get(), now);

  next->question = Present(*question, session.options.randomize_options,
                           entry->random.get());
  next->index = index;
  if (session.has_adaptive_state) {
    next->total = std::min<uint32_t>(session.options.adaptive_config.max_questions,
                                     entry->questions->size());
  } else {
    next->total = session.question_order.size();
  }
  next->time_remaining_seconds = -1;
  if (session.options.time_limit_seconds > 0) {
    int64_t left =
        static_cast<int64_t>(session.options.time_limit_seconds) * 1000 -
        ActiveMillis(session, now);
    next->time_remaining_seconds = std::max<int64_t>(0, left) / 1000;
  }
  if (started) SaveAndReschedule(entry);
  return true;
}

void Engine::Advance(Entry* entry, const std::string& question_id) {
  Session& session = entry->session;
  uint32_t& index = session.current_question_index;
  if (index >= session.question_order.size() ||
      session.question_order[index] != question_id) {
    return;
  }
  index++;
  if (session.has_adaptive_state) return;
  while (index < session.question_order.size() &&
         session.answers.count(session.question_order[index])) {
    index++;
  }
}

SubmitResult Engine::Record(const EntryPtr& entry,
                            const catalog::Question& question,
                            AnswerRecord record, int64_t now) {
  Session& session = entry->session;
  bool adaptive = session.has_adaptive_state;
  if (adaptive && session.answers.count(question.id)) {
    throw SessionError(ErrorCode::INVALID_STATE,
                       "Question " + question.id + " was already answered");
  }
  bool can_end = session.status == Status::IN_PROGRESS;
  SubmitResult result;
  result.scored = record.scored;
  result.is_correct = record.is_correct;
  result.points_awarded = record.points_awarded;
  session.answers[question.id] = std::move(record);
  session.total_score = TotalScore(session);
  result.running_total = session.total_score;
  Touch(entry.get(), now);
  Advance(entry.get(), question.id);

  if (adaptive && result.scored) {
    adaptive::State& state = session.adaptive_state;
    SelectorFor(session).ProcessAnswer(
        &state, question, result.is_correct,
        std::max<int64_t>(0, now - session.presented_at),
        entry->random.get());
    if (state.complete && can_end) {
      Finish(entry.get(), Status::COMPLETED, state.completion_reason, now);
      result.session_completed = true;
      return result;
    }
  }
  // Unscored answers count towards the maximum too.
  const char* reason = nullptr;
  if (adaptive && session.current_question_index >=
                      session.options.adaptive_config.max_questions) {
    reason = kMaximumQuestionsReached;
  } else if (!adaptive && session.current_question_index >=
                              session.question_order.size()) {
    reason = kAllQuestionsAnswered;
  }
  if (reason != nullptr && can_end) {
    Finish(entry.get(), Status::COMPLETED, reason, now);
    result.session_completed = true;
    return result;
  }
  SaveAndReschedule(entry);
  return result;
}

SubmitResult Engine::SubmitAnswer(const std::string& session_id,
                                  const std::string& question_id,
                                  AnswerValue value) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  RequireInProgress(*entry, "submitAnswer");
  const catalog::Question& question = QuestionFor(entry.get(), question_id);
  if (question.type == catalog::QuestionType::CODING) {
    throw SessionError(ErrorCode::INVALID_STATE,
                       "Question " + question_id + " expects code");
  }
  return Record(entry, question, ScoreAnswer(question, std::move(value), now),
                now);
}

executor::ExecutionSummary Engine::SubmitCode(const std::string& session_id,
                                              const std::string& question_id,
                                              const std::string& source_code,
                                              const std::string& language) {
  EntryPtr entry = Find(session_id);
  executor::ExecutionRequest request;
  const catalog::Question* question = nullptr;
  int64_t submitted_at = 0;
  {
    std::lock_guard<std::mutex> lck(entry->mutex);
    int64_t now = clock_->NowMillis();
    CheckOpen(entry.get(), now);
    RequireInProgress(*entry, "submitCode");
    question = &QuestionFor(entry.get(), question_id);
    if (question->type != catalog::QuestionType::CODING) {
      throw SessionError(ErrorCode::INVALID_STATE,
                         "Question " + question_id + " does not take code");
    }
    if (!executor_->Supports(language)) {
      throw SessionError(ErrorCode::UNSUPPORTED_LANGUAGE,
                         "Language " + language + " is not supported");
    }
    if (source_code.size() > executor::Executor::kMaxSourceBytes) {
      throw SessionError(
          ErrorCode::SOURCE_TOO_LARGE,
          "Source code of " + std::to_string(source_code.size()) +
              " bytes, at most " +
              std::to_string(executor::Executor::kMaxSourceBytes) +
              " are accepted");
    }
    Session& session = entry->session;
    if (session.has_adaptive_state && session.answers.count(question_id)) {
      throw SessionError(ErrorCode::INVALID_STATE,
                         "Question " + question_id + " was already answered");
    }
    CodeRecord& code = session.code_submissions[question_id];
    code = CodeRecord();
    code.question_id = question_id;
    code.source_code = source_code;
    code.language = language;
    code.submitted_at = submitted_at = now;
    Touch(entry.get(), now);
    SaveAndReschedule(entry);

    request.language = language;
    request.source = source_code;
    request.cases = question->test_cases;
    request.time_limit_seconds = question->time_limit_seconds;
    request.memory_limit_mb = question->memory_limit_mb;
    request.run_all_cases = session.options.run_all_test_cases;
    entry->running_submissions++;
  }

  executor::ExecutionSummary summary;
  try {
    summary = executor_->Execute(request);
  } catch (...) {
    std::lock_guard<std::mutex> lck(entry->mutex);
    entry->running_submissions--;
    throw;
  }
  KJ_LOG(INFO, "Submission evaluated", session_id, question_id, language,
         summary.passed, summary.executed, summary.total);

  // The submission started in time: its result is recorded even if the time
  // limit passed meanwhile, and the session expires on the next call.
  std::lock_guard<std::mutex> lck(entry->mutex);
  entry->running_submissions--;
  Session& session = entry->session;
  int64_t now = clock_->NowMillis();
  if (IsTerminal(session.status)) {
    KJ_LOG(WARNING, "Session ended while a submission ran", session_id,
           question_id);
    return summary;
  }
  auto it = session.code_submissions.find(question_id);
  if (it == session.code_submissions.end() ||
      it->second.submitted_at != submitted_at ||
      it->second.source_code != source_code) {
    // A newer submission replaced this one.
    return summary;
  }
  it->second.has_result = true;
  it->second.last_execution_result = ForRecord(summary);
  Record(entry, *question, ScoreCode(*question, summary, now), now);
  return summary;
}

void Engine::PauseSession(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  RequireInProgress(*entry, "pauseSession");
  Session& session = entry->session;
  session.status = Status::PAUSED;
  session.paused_at = now;
  CancelAutoSave(entry.get());
  Touch(entry.get(), now);
  Save(entry.get(), false);
  KJ_LOG(INFO, "Session paused", session_id);
}

void Engine::ResumeSession(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  Session& session = entry->session;
  if (session.status != Status::PAUSED) {
    throw SessionError(ErrorCode::INVALID_STATE,
                       "resumeSession on session " + session_id +
                           " which is " + StatusName(session.status));
  }
  session.paused_millis += now - session.paused_at;
  session.paused_at = 0;
  session.status = Status::IN_PROGRESS;
  Touch(entry.get(), now);
  Save(entry.get(), false);
  if (session.options.auto_save) ScheduleAutoSave(entry, 0);
  KJ_LOG(INFO, "Session resumed", session_id, session.paused_millis);
}

SessionResult Engine::CompleteSession(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  RequireInProgress(*entry, "completeSession");
  Finish(entry.get(), Status::COMPLETED, kCompleted, now);
  return Result(entry.get());
}

SessionResult Engine::TerminateSession(const std::string& session_id,
                                       const std::string& reason) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  Finish(entry.get(), Status::TERMINATED, reason.empty() ? kTerminated : reason,
         now);
  return Result(entry.get());
}

void Engine::ReportViolation(const std::string& session_id,
                             ViolationRecord violation) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  CheckOpen(entry.get(), now);
  Session& session = entry->session;
  if (violation.timestamp == 0) violation.timestamp = now;
  KJ_LOG(WARNING, "Violation reported", session_id, violation.type,
         violation.severity);
  session.violations.push_back(std::move(violation));
  Touch(entry.get(), now);
  uint32_t threshold = session.options.violation_threshold;
  if (threshold > 0 && session.violations.size() >= threshold) {
    Finish(entry.get(), Status::TERMINATED, kViolationThresholdExceeded, now);
    return;
  }
  SaveAndReschedule(entry);
}

Session Engine::ResumeAfterInterruption(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  Session& session = entry->session;
  if (session.status == Status::EXPIRED) {
    throw SessionError(ErrorCode::SESSION_EXPIRED,
                       "Session " + session_id + " ran out of time",
                       Result(entry.get()));
  }
  CheckOpen(entry.get(), now);
  Touch(entry.get(), now);
  KJ_LOG(INFO, "Session resumed after interruption", session_id,
         StatusName(session.status), session.current_question_index);
  return session;
}

SessionStats Engine::GetSessionStats(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  int64_t now = clock_->NowMillis();
  ExpireIfOverdue(entry.get(), now);
  const Session& session = entry->session;
  SessionStats stats;
  stats.status = session.status;
  stats.duration_millis = ActiveMillis(session, now);
  stats.questions_answered = session.answers.size();
  stats.code_submissions = session.code_submissions.size();
  stats.violations = session.violations.size();
  stats.last_activity_at = session.last_activity_at;
  stats.last_auto_save_at = session.last_auto_save_at;
  return stats;
}

SessionResult Engine::GetResult(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  ExpireIfOverdue(entry.get(), clock_->NowMillis());
  return Result(entry.get());
}

Session Engine::Snapshot(const std::string& session_id) {
  EntryPtr entry = Find(session_id);
  std::lock_guard<std::mutex> lck(entry->mutex);
  return entry->session;
}

size_t Engine::CachedSessions() {
  std::lock_guard<std::mutex> lck(mutex_);
  return entries_.size();
}

size_t Engine::SweepExpired() {
  return Sweep(/*scan_store=*/true, /*skip_busy=*/false);
}

size_t Engine::Sweep(bool scan_store, bool skip_busy) {
  std::set<std::string> ids;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (const auto& kv : entries_) ids.insert(kv.first);
  }
  if (scan_store) {
    std::set<std::string> cached = ids;
    for (const std::string& id : store_->List()) {
      if (cached.count(id)) continue;
      // Only sessions that can expire are worth loading.
      store::StoredSession stored;
      if (store_->Get(id, &stored) &&
          Overdue(stored.session, clock_->NowMillis())) {
        ids.insert(id);
      }
    }
  }
  size_t expired = 0;
  for (const std::string& id : ids) {
    EntryPtr entry;
    try {
      entry = Find(id);
    } catch (const SessionError& exc) {
      KJ_LOG(WARNING, "Cannot load session", id, exc.what());
      continue;
    }
    std::unique_lock<std::mutex> lck(entry->mutex, std::defer_lock);
    if (skip_busy) {
      // The call holding the session checks expiry itself.
      if (!lck.try_lock()) continue;
    } else {
      lck.lock();
    }
    try {
      if (ExpireIfOverdue(entry.get(), clock_->NowMillis())) expired++;
    } catch (const store::PersistenceConflict& exc) {
      KJ_LOG(WARNING, "Session changed elsewhere, not expired", id,
             exc.what());
    }
  }
  if (expired) KJ_LOG(INFO, "Expired overdue sessions", expired);
  return expired;
}

void Engine::ScheduleSweep(int64_t delay_millis, bool scan_store) {
  if (stopping_) return;
  sweep_task_ = scheduler_.Schedule(
      delay_millis, [this, scan_store]() { BackgroundSweep(scan_store); });
}

void Engine::BackgroundSweep(bool scan_store) {
  try {
    Sweep(scan_store, /*skip_busy=*/true);
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Expiry sweep failed", exc.what());
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Expiry sweep failed", exc.getDescription());
  }
  // Stored sessions are scanned once, later they are loaded by their calls.
  ScheduleSweep(sweep_interval_millis_, /*scan_store=*/false);
}

void Engine::ScheduleEviction(const std::string& session_id,
                              int64_t delay_millis) {
  if (stopping_) return;
  scheduler_.Schedule(delay_millis,
                      [this, session_id]() { EvictIfEnded(session_id); });
}

void Engine::EvictIfEnded(const std::string& session_id) {
  EntryPtr entry;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) return;
    entry = it->second;
  }
  std::unique_lock<std::mutex> entry_lck(entry->mutex, std::try_to_lock);
  if (!entry_lck.owns_lock()) {
    ScheduleEviction(session_id, busy_retry_millis_);
    return;
  }
  if (!IsTerminal(entry->session.status) ||
      entry->revision != entry->saved_revision) {
    return;
  }
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = entries_.find(session_id);
  if (it != entries_.end() && it->second == entry) {
    entries_.erase(it);
    KJ_LOG(INFO, "Ended session dropped from memory", session_id);
  }
}

SessionResult Engine::Result(Entry* entry) const {
  const Session& session = entry->session;
  SessionResult result;
  result.session_id = session.session_id;
  result.status = session.status;
  result.total_score = TotalScore(session);
  result.max_score = MaxScore(session, entry->index);
  if (result.max_score > 0) {
    result.percentage = 100 * result.total_score / result.max_score;
  }
  result.questions_answered = session.answers.size();
  result.questions_total = session.question_order.empty()
                               ? entry->questions->size()
                               : session.question_order.size();
  for (const auto& answer : session.answers) {
    if (!answer.second.scored) result.pending_review++;
  }
  result.end_reason = session.end_reason;
  result.completed_at = session.completed_at;
  if (session.has_adaptive_state) {
    result.has_adaptive_results = true;
    result.adaptive_results =
        SelectorFor(session).Summarize(session.adaptive_state);
  }
  return result;
}

void Engine::Touch(Entry* entry, int64_t now) {
  entry->session.last_activity_at = now;
  entry->revision++;
}

void Engine::Save(Entry* entry, bool autosave) {
  Session& session = entry->session;
  int64_t previous = session.last_auto_save_at;
  session.total_score = TotalScore(session);
  session.max_score = MaxScore(session, entry->index);
  if (autosave) {
    session.last_auto_save_at = std::max(previous, clock_->NowMillis());
  }
  try {
    entry->version = store_->Put(session, entry->version);
  } catch (const store::PersistenceConflict&) {
    session.last_auto_save_at = previous;
    Evict(entry);
    throw;
  } catch (...) {
    session.last_auto_save_at = previous;
    throw;
  }
  entry->saved_revision = entry->revision;
}

void Engine::Evict(Entry* entry) {
  CancelAutoSave(entry);
  entry->saved_revision = entry->revision;
  const std::string& id = entry->session.session_id;
  KJ_LOG(WARNING, "Session changed elsewhere, dropping the local copy", id);
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = entries_.find(id);
  if (it != entries_.end() && it->second.get() == entry) entries_.erase(it);
}

void Engine::SaveAndReschedule(const EntryPtr& entry) {
  Save(entry.get(), false);
  const Session& session = entry->session;
  if (session.status == Status::IN_PROGRESS && session.options.auto_save) {
    ScheduleAutoSave(entry, autosave_interval_millis_);
  }
}

void Engine::ScheduleAutoSave(const EntryPtr& entry, int64_t delay_millis) {
  uint64_t generation = ++entry->autosave_generation;
  scheduler_.Cancel(entry->autosave_task.exchange(0));
  std::weak_ptr<Entry> weak = entry;
  entry->autosave_task = scheduler_.Schedule(
      delay_millis, [this, weak, generation]() { AutoSave(weak, generation); });
}

void Engine::CancelAutoSave(Entry* entry) {
  ++entry->autosave_generation;
  scheduler_.Cancel(entry->autosave_task.exchange(0));
}

void Engine::AutoSave(const std::weak_ptr<Entry>& weak, uint64_t generation) {
  EntryPtr entry = weak.lock();
  if (!entry || entry->autosave_generation != generation) return;
  auto again = [this, weak, generation]() { AutoSave(weak, generation); };
  std::unique_lock<std::mutex> lck(entry->mutex, std::try_to_lock);
  if (!lck.owns_lock()) {
    entry->autosave_task = scheduler_.Schedule(busy_retry_millis_, again);
    return;
  }
  if (entry->autosave_generation != generation ||
      entry->session.status != Status::IN_PROGRESS) {
    return;
  }
  const std::string& id = entry->session.session_id;
  if (entry->revision != entry->saved_revision) {
    try {
      Save(entry.get(), true);
      KJ_LOG(INFO, "Session auto-saved", id, entry->version);
    } catch (const store::PersistenceConflict& exc) {
      KJ_LOG(ERROR, "Auto-save refused", id, exc.what());
      return;
    } catch (const std::exception& exc) {
      KJ_LOG(ERROR, "Auto-save failed", id, exc.what());
    } catch (const kj::Exception& exc) {
      KJ_LOG(ERROR, "Auto-save failed", id, exc.getDescription());
    }
  }
  entry->autosave_task = scheduler_.Schedule(autosave_interval_millis_, again);
}

}  // namespace session
