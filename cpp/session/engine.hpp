#ifndef SESSION_ENGINE_HPP
#define SESSION_ENGINE_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <kj/common.h>

#include "adaptive/selector.hpp"
#include "catalog/catalog.hpp"
#include "executor/executor.hpp"
#include "session/errors.hpp"
#include "session/model.hpp"
#include "session/ordering.hpp"
#include "session/scoring.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"
#include "util/random.hpp"
#include "util/scheduler.hpp"

namespace session {

struct NextQuestion {
  PresentedQuestion question;
  // Position of the question, starting from 0.
  uint32_t index = 0;
  // Questions in the test. For adaptive tests, the most that can be asked.
  uint32_t total = 0;
  // Seconds left before the session expires, -1 without a time limit.
  int64_t time_remaining_seconds = -1;
};

struct SubmitResult {
  bool scored = false;
  bool is_correct = false;
  double points_awarded = 0;
  double running_total = 0;
  // The answer ended the session.
  bool session_completed = false;
};

struct SessionStats {
  Status status = Status::NOT_STARTED;
  // Active time, pauses excluded.
  int64_t duration_millis = 0;
  uint32_t questions_answered = 0;
  uint32_t code_submissions = 0;
  uint32_t violations = 0;
  int64_t last_activity_at = 0;
  int64_t last_auto_save_at = 0;
};

struct EngineOptions {
  // Zero or less means Flags::autosave_interval_millis.
  int64_t autosave_interval_millis = 0;
  // Delay before retrying an auto-save that found its session busy.
  int64_t busy_retry_millis = 50;
  // Period of the background expiry sweep. Zero means
  // Flags::sweep_interval_millis, negative disables the sweep.
  int64_t sweep_interval_millis = 0;
  // Ended sessions are dropped from memory after this long. They stay in the
  // store.
  int64_t terminal_retention_millis = 60000;
  util::Clock* clock = nullptr;
};

// Drives assessment sessions through their lifecycle. Calls on different
// sessions run in parallel, calls on the same session are serialized. Every
// state transition, answer and violation is persisted before the call
// returns; a background task also saves in-progress sessions that changed
// since their last save.
//
// Overdue sessions expire on their next call, or when the background sweep
// finds them. A session with a code submission running expires only after
// the submission is recorded.
//
// Failures are reported by throwing SessionError, or PersistenceConflict when
// another writer updated the stored record.
class Engine {
 public:
  Engine(const catalog::QuestionCatalog* catalog, store::SessionStore* store,
         executor::Executor* executor, EngineOptions options = {});
  // Saves every session with unsaved changes.
  ~Engine();
  KJ_DISALLOW_COPY(Engine);

  // Returns the id of the open session of the candidate for the test if
  // there is one, or creates a new session.
  std::string CreateSession(const std::string& candidate_id,
                            const std::string& test_id, Options options);

  // Starts the session on the first call. Returns false when no question is
  // left, which completes the session.
  bool GetNextQuestion(const std::string& session_id, NextQuestion* next);

  SubmitResult SubmitAnswer(const std::string& session_id,
                            const std::string& question_id,
                            AnswerValue value);

  // The submission is persisted before it runs. The session is not locked
  // while the code runs. Sources over Executor::kMaxSourceBytes are refused
  // with SOURCE_TOO_LARGE. Outputs are clipped in the recorded copy of the
  // result, not in the returned one.
  executor::ExecutionSummary SubmitCode(const std::string& session_id,
                                        const std::string& question_id,
                                        const std::string& source_code,
                                        const std::string& language);

  void PauseSession(const std::string& session_id);
  void ResumeSession(const std::string& session_id);
  SessionResult CompleteSession(const std::string& session_id);
  SessionResult TerminateSession(const std::string& session_id,
                                 const std::string& reason);

  // Terminates the session once the configured number of violations is
  // reached.
  void ReportViolation(const std::string& session_id,
                       ViolationRecord violation);

  // State of the session for a client that lost its connection. Sessions the
  // engine does not hold are recovered from the store.
  Session ResumeAfterInterruption(const std::string& session_id);

  SessionStats GetSessionStats(const std::string& session_id);

  // Final result of terminal sessions, running score of the others.
  SessionResult GetResult(const std::string& session_id);

  // Expires every overdue session, stored ones included, returns how many.
  size_t SweepExpired();

  // Copy of the live state.
  Session Snapshot(const std::string& session_id);

  // Sessions held in memory.
  size_t CachedSessions();

 private:
  struct Entry {
    std::mutex mutex;
    Session session;
    // Version of the stored record.
    uint64_t version = 0;
    // Bumped on every change of the live state.
    uint64_t revision = 0;
    uint64_t saved_revision = 0;
    const std::vector<catalog::Question>* questions = nullptr;
    QuestionIndex index;
    std::unique_ptr<util::Random> random;
    // Code submissions being executed. The session does not expire while
    // there are some.
    uint32_t running_submissions = 0;
    // Tasks of an older generation stop instead of saving.
    std::atomic<uint64_t> autosave_generation{0};
    std::atomic<util::Scheduler::TaskId> autosave_task{0};
  };
  using EntryPtr = std::shared_ptr<Entry>;

  // Cached entry, or the stored session. Throws INVALID_SESSION.
  EntryPtr Find(const std::string& session_id);
  // Builds an entry around a session of a known test.
  EntryPtr MakeEntry(Session session, uint64_t version);

  std::string NewSessionId();
  // Open session of a candidate for a test, empty if there is none. Called
  // with create_mutex_ held.
  std::string FindOpenSession(const std::string& candidate_id,
                              const std::string& test_id);
  void LoadOpenSessions();

  // Throws SESSION_CLOSED for terminal sessions, SESSION_EXPIRED for overdue
  // ones, which are expired unless a submission is running.
  void CheckOpen(Entry* entry, int64_t now);
  bool ExpireIfOverdue(Entry* entry, int64_t now);
  // Throws INVALID_STATE unless the session is in progress.
  void RequireInProgress(const Entry& entry, const char* operation);
  bool Overdue(const Session& session, int64_t now) const;
  int64_t ActiveMillis(const Session& session, int64_t now) const;

  void Start(Entry* entry, int64_t now);
  // Terminal transition, persisted.
  void Finish(Entry* entry, Status status, const std::string& reason,
              int64_t now);
  const catalog::Question& QuestionFor(Entry* entry,
                                       const std::string& question_id);
  // Stores an answer, feeds it to the selector and moves the session
  // forward. Persists the session. Only an in-progress session is completed
  // by its last answer.
  SubmitResult Record(const EntryPtr& entry,
                      const catalog::Question& question, AnswerRecord record,
                      int64_t now);
  void Advance(Entry* entry, const std::string& question_id);

  SessionResult Result(Entry* entry) const;
  adaptive::Selector SelectorFor(const Session& session) const;

  void Touch(Entry* entry, int64_t now);
  // Writes the session to the store. On PersistenceConflict the entry is
  // evicted, so that the next call reloads the stored record.
  void Save(Entry* entry, bool autosave);
  void Evict(Entry* entry);
  // Saves, then restarts the auto-save cadence.
  void SaveAndReschedule(const EntryPtr& entry);
  void ScheduleAutoSave(const EntryPtr& entry, int64_t delay_millis);
  void CancelAutoSave(Entry* entry);
  void AutoSave(const std::weak_ptr<Entry>& weak, uint64_t generation);

  // Drops an ended session from memory after the retention delay.
  void ScheduleEviction(const std::string& session_id, int64_t delay_millis);
  void EvictIfEnded(const std::string& session_id);

  // Busy sessions are skipped when skip_busy is set, stored sessions are
  // loaded when scan_store is set.
  size_t Sweep(bool scan_store, bool skip_busy);
  void ScheduleSweep(int64_t delay_millis, bool scan_store);
  void BackgroundSweep(bool scan_store);

  const catalog::QuestionCatalog* catalog_;
  store::SessionStore* store_;
  executor::Executor* executor_;
  util::Clock* clock_;
  int64_t autosave_interval_millis_;
  int64_t busy_retry_millis_;
  int64_t sweep_interval_millis_;
  int64_t retention_millis_;

  std::mutex mutex_;
  std::map<std::string, EntryPtr> entries_;
  util::Random ids_;

  std::mutex create_mutex_;
  // Non-terminal sessions by candidate and test, filled from the store on
  // first use. Entries may be stale and are checked on lookup. Guarded by
  // create_mutex_.
  bool open_sessions_loaded_ = false;
  std::map<std::pair<std::string, std::string>, std::string> open_sessions_;

  std::atomic<bool> stopping_{false};
  std::atomic<util::Scheduler::TaskId> sweep_task_{0};

  // Last member: its thread stops before the entries go away.
  util::Scheduler scheduler_;
};

}  // namespace session

#endif
