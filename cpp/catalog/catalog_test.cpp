#include "catalog/catalog.hpp"

#include <kj/exception.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;

using catalog::InMemoryCatalog;
using catalog::Question;
using catalog::QuestionType;
using catalog::Test;

const char* kCatalog = R"({
  "tests": [{
    "id": "backend",
    "title": "Backend engineer",
    "questions": [
      {
        "id": "q1",
        "type": "multipleChoice",
        "difficulty": 0.3,
        "options": [
          {"id": "a", "text": "TCP", "isCorrect": true},
          {"id": "b", "text": "UDP"}
        ]
      },
      {
        "id": "q2",
        "type": "coding",
        "points": 10,
        "language": "python",
        "timeLimitSeconds": 5,
        "testCases": [
          {"input": "1 2", "expectedOutput": "3"},
          {"input": "2 2", "expectedOutput": "4", "isHidden": true}
        ]
      },
      {"id": "q3", "type": "essay"}
    ]
  }]
})";

// NOLINTNEXTLINE
TEST(CatalogTest, FromJson) {
  InMemoryCatalog catalog = InMemoryCatalog::FromJson(kCatalog);
  EXPECT_THAT(catalog.TestIds(), ElementsAre("backend"));
  const std::vector<Question>* questions =
      catalog.GetQuestionsForTest("backend");
  ASSERT_NE(questions, nullptr);
  ASSERT_EQ(questions->size(), 3u);

  const Question& q1 = (*questions)[0];
  EXPECT_EQ(q1.id, "q1");
  EXPECT_EQ(q1.type, QuestionType::MULTIPLE_CHOICE);
  EXPECT_DOUBLE_EQ(q1.difficulty, 0.3);
  EXPECT_DOUBLE_EQ(q1.points, 1);
  ASSERT_EQ(q1.options.size(), 2u);
  EXPECT_TRUE(q1.options[0].is_correct);
  EXPECT_FALSE(q1.options[1].is_correct);

  const Question& q2 = (*questions)[1];
  EXPECT_EQ(q2.type, QuestionType::CODING);
  EXPECT_DOUBLE_EQ(q2.difficulty, 0.5);
  EXPECT_DOUBLE_EQ(q2.points, 10);
  EXPECT_EQ(q2.time_limit_seconds, 5u);
  ASSERT_EQ(q2.test_cases.size(), 2u);
  EXPECT_FALSE(q2.test_cases[0].hidden);
  EXPECT_TRUE(q2.test_cases[1].hidden);
  EXPECT_EQ(q2.test_cases[1].expected_output, "4");

  EXPECT_EQ((*questions)[2].type, QuestionType::ESSAY);
}

// NOLINTNEXTLINE
TEST(CatalogTest, UnknownTest) {
  InMemoryCatalog catalog;
  EXPECT_EQ(catalog.GetQuestionsForTest("missing"), nullptr);
}

// NOLINTNEXTLINE
TEST(CatalogTest, RejectsInvalidQuestions) {
  InMemoryCatalog catalog;
  Question q;
  q.id = "q";
  q.type = QuestionType::MULTIPLE_CHOICE;
  EXPECT_THROW(catalog.AddTest(Test{"t", "", {q}}), kj::Exception);

  q.options = {{"a", "A", true}};
  q.difficulty = 1.5;
  EXPECT_THROW(catalog.AddTest(Test{"t", "", {q}}), kj::Exception);

  q.difficulty = 0.5;
  EXPECT_THROW(catalog.AddTest(Test{"t", "", {q, q}}), kj::Exception);

  Question coding;
  coding.id = "c";
  coding.type = QuestionType::CODING;
  EXPECT_THROW(catalog.AddTest(Test{"t", "", {coding}}), kj::Exception);

  catalog.AddTest(Test{"t", "", {q}});
  EXPECT_NE(catalog.GetQuestionsForTest("t"), nullptr);
}

}  // namespace
