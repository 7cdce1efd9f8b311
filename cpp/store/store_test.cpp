#include "store/store.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include <kj/exception.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "store/codec.hpp"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using store::FileSessionStore;
using store::MemorySessionStore;
using store::PersistenceConflict;
using store::SessionStore;
using store::StoredSession;

const char* test_tmpdir = "/tmp/examiner_testdir";

session::Session MakeSession(const std::string& id) {
  session::Session session;
  session.session_id = id;
  session.candidate_id = "candidate";
  session.test_id = "test";
  return session;
}

// A session that sets every field of the record.
session::Session FullSession() {
  session::Session session = MakeSession("full");
  session.status = session::Status::PAUSED;
  session.created_at = 1000;
  session.started_at = 2000;
  session.current_question_index = 1;
  session.question_order = {"q1", "q2", "q3"};
  session::AnswerRecord answer;
  answer.question_id = "q1";
  answer.value.selected = {"a", "c"};
  answer.scored = true;
  answer.is_correct = true;
  answer.points_awarded = 2.5;
  answer.submitted_at = 2500;
  session.answers["q1"] = answer;
  session::AnswerRecord essay;
  essay.question_id = "q3";
  essay.value.text = "Because";
  session.answers["q3"] = essay;
  session::CodeRecord code;
  code.question_id = "q2";
  code.source_code = "print(1)";
  code.language = "python";
  code.submitted_at = 2600;
  code.has_result = true;
  code.last_execution_result.language = "python";
  code.last_execution_result.passed = 1;
  code.last_execution_result.executed = 2;
  code.last_execution_result.total = 3;
  code.last_execution_result.security_flags = {"flag"};
  executor::CaseResult result;
  result.status = executor::CaseStatus::TIMEOUT;
  result.hidden = true;
  result.actual_output = "1\n";
  result.time_millis = 2001;
  result.signal = 9;
  code.last_execution_result.cases = {result};
  session.code_submissions["q2"] = code;
  session::ViolationRecord violation;
  violation.type = "tab_switch";
  violation.severity = "high";
  violation.timestamp = 2700;
  violation.details = {{"count", "3"}};
  session.violations.push_back(violation);
  session.last_activity_at = 2800;
  session.last_auto_save_at = 2750;
  session.paused_at = 2900;
  session.paused_millis = 120;
  session.presented_at = 2550;
  session.options.time_limit_seconds = 3600;
  session.options.adaptive = true;
  session.options.adaptive_config.max_questions = 20;
  session.options.auto_save = false;
  session.options.violation_threshold = 3;
  session.options.seed = 99;
  session.has_adaptive_state = true;
  session.adaptive_state.ability = 0.7;
  session.adaptive_state.answered = 1;
  session.adaptive_state.ability_history = {0.5, 0.7};
  session.adaptive_state.history.push_back({"q1", true, 4000, 0.5, 0.5});
  session.total_score = 2.5;
  session.max_score = 12.5;
  return session;
}

// NOLINTNEXTLINE
TEST(CodecTest, RecordKeepsEverything) {
  session::Session session = FullSession();
  uint64_t version = 0;
  session::Session decoded =
      store::Deserialize(store::Serialize(session, 7), &version);
  EXPECT_EQ(version, 7u);
  EXPECT_EQ(store::ToJson(decoded), store::ToJson(session));
  EXPECT_EQ(decoded.status, session::Status::PAUSED);
  EXPECT_THAT(decoded.answers["q1"].value.selected, ElementsAre("a", "c"));
  EXPECT_FALSE(decoded.answers["q3"].scored);
  EXPECT_EQ(decoded.code_submissions["q2"].last_execution_result.cases[0].status,
            executor::CaseStatus::TIMEOUT);
  EXPECT_FALSE(decoded.options.auto_save);
  EXPECT_EQ(decoded.adaptive_state.history[0].response_millis, 4000);
}

// NOLINTNEXTLINE
TEST(CodecTest, LargeRecords) {
  session::Session session = FullSession();
  executor::CaseResult& result =
      session.code_submissions["q2"].last_execution_result.cases[0];
  result.actual_output.assign(80 << 20, 'x');
  std::string data = store::Serialize(session, 3);
  EXPECT_EQ(store::RecordVersion(data), 3u);
  uint64_t version = 0;
  session::Session decoded = store::Deserialize(data, &version);
  EXPECT_EQ(version, 3u);
  EXPECT_EQ(decoded.code_submissions["q2"]
                .last_execution_result.cases[0]
                .actual_output.size(),
            80u << 20);
}

// NOLINTNEXTLINE
TEST(CodecTest, RejectsGarbage) {
  uint64_t version = 0;
  EXPECT_THROW(store::Deserialize("garbage", &version), kj::Exception);
}

using StoreFactory = std::function<std::unique_ptr<SessionStore>()>;

class SessionStoreTest : public ::testing::TestWithParam<StoreFactory> {
 protected:
  void SetUp() override { store_ = GetParam()(); }
  std::unique_ptr<SessionStore> store_;
};

// NOLINTNEXTLINE
TEST_P(SessionStoreTest, PutAndGet) {
  StoredSession stored;
  EXPECT_FALSE(store_->Get("s1", &stored));
  EXPECT_EQ(store_->Put(MakeSession("s1"), 0), 1u);
  ASSERT_TRUE(store_->Get("s1", &stored));
  EXPECT_EQ(stored.version, 1u);
  EXPECT_EQ(stored.session.candidate_id, "candidate");

  session::Session updated = MakeSession("s1");
  updated.current_question_index = 4;
  EXPECT_EQ(store_->Put(updated, 1), 2u);
  ASSERT_TRUE(store_->Get("s1", &stored));
  EXPECT_EQ(stored.version, 2u);
  EXPECT_EQ(stored.session.current_question_index, 4u);
}

// NOLINTNEXTLINE
TEST_P(SessionStoreTest, StaleWritesAreRefused) {
  store_->Put(MakeSession("s1"), 0);
  store_->Put(MakeSession("s1"), 1);
  EXPECT_THROW(store_->Put(MakeSession("s1"), 1), PersistenceConflict);
  EXPECT_THROW(store_->Put(MakeSession("s1"), 0), PersistenceConflict);
  EXPECT_THROW(store_->Put(MakeSession("s2"), 3), PersistenceConflict);
  StoredSession stored;
  EXPECT_FALSE(store_->Get("s2", &stored));
  ASSERT_TRUE(store_->Get("s1", &stored));
  EXPECT_EQ(stored.version, 2u);
}

// NOLINTNEXTLINE
TEST_P(SessionStoreTest, List) {
  EXPECT_THAT(store_->List(), IsEmpty());
  store_->Put(MakeSession("b"), 0);
  store_->Put(MakeSession("a"), 0);
  EXPECT_THAT(store_->List(), ElementsAre("a", "b"));
}

// NOLINTNEXTLINE
TEST_P(SessionStoreTest, ConcurrentWritersAreSerialized) {
  const int threads = 4;
  const int writes = 25;
  store_->Put(MakeSession("s"), 0);
  std::atomic<int> conflicts(0);
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; t++) {
    workers.emplace_back([this, &conflicts]() {
      for (int done = 0; done < writes;) {
        StoredSession stored;
        ASSERT_TRUE(store_->Get("s", &stored));
        stored.session.current_question_index++;
        try {
          store_->Put(stored.session, stored.version);
          done++;
        } catch (const PersistenceConflict&) {
          conflicts++;
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();
  StoredSession stored;
  ASSERT_TRUE(store_->Get("s", &stored));
  EXPECT_EQ(stored.version, 1u + threads * writes);
  EXPECT_EQ(stored.session.current_question_index,
            static_cast<uint32_t>(threads * writes));
}

std::unique_ptr<SessionStore> NewMemoryStore() {
  return std::unique_ptr<SessionStore>(new MemorySessionStore);
}

std::unique_ptr<SessionStore> NewFileStore() {
  static util::TempDir* dir = nullptr;
  delete dir;
  dir = new util::TempDir(test_tmpdir);
  return std::unique_ptr<SessionStore>(new FileSessionStore(dir->Path()));
}

INSTANTIATE_TEST_CASE_P(Stores, SessionStoreTest,
                        ::testing::Values(&NewMemoryStore, &NewFileStore));

// NOLINTNEXTLINE
TEST(FileSessionStoreTest, SurvivesRestart) {
  util::TempDir dir(test_tmpdir);
  {
    FileSessionStore store(dir.Path());
    store.Put(FullSession(), 0);
    store.Put(FullSession(), 1);
  }
  FileSessionStore store(dir.Path());
  StoredSession stored;
  ASSERT_TRUE(store.Get("full", &stored));
  EXPECT_EQ(stored.version, 2u);
  EXPECT_EQ(store::ToJson(stored.session), store::ToJson(FullSession()));
  EXPECT_THROW(store.Put(FullSession(), 1), PersistenceConflict);
  EXPECT_EQ(store.Put(FullSession(), 2), 3u);
}

// NOLINTNEXTLINE
TEST(FileSessionStoreTest, StoresSharingADirectory) {
  util::TempDir dir(test_tmpdir);
  FileSessionStore first(dir.Path());
  FileSessionStore second(dir.Path());
  EXPECT_EQ(first.Put(MakeSession("s"), 0), 1u);
  StoredSession stored;
  ASSERT_TRUE(second.Get("s", &stored));
  stored.session.status = session::Status::PAUSED;
  EXPECT_EQ(second.Put(stored.session, stored.version), 2u);
  EXPECT_THROW(first.Put(MakeSession("s"), 1), PersistenceConflict);
  EXPECT_THROW(first.Put(MakeSession("s"), 0), PersistenceConflict);
  ASSERT_TRUE(first.Get("s", &stored));
  EXPECT_EQ(stored.version, 2u);
  EXPECT_EQ(stored.session.status, session::Status::PAUSED);
  EXPECT_EQ(first.Put(stored.session, 2), 3u);
  EXPECT_THAT(second.List(), ElementsAre("s"));
}

// NOLINTNEXTLINE
TEST(FileSessionStoreTest, RejectsUnsafeIds) {
  util::TempDir dir(test_tmpdir);
  FileSessionStore store(dir.Path());
  EXPECT_THROW(store.Put(MakeSession("../escape"), 0), kj::Exception);
}

}  // namespace
