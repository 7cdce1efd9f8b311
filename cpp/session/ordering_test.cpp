#include "session/ordering.hpp"

#include <map>
#include <set>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

using catalog::Question;
using catalog::QuestionType;

std::vector<Question> Questions(size_t n) {
  std::vector<Question> questions(n);
  for (size_t i = 0; i < n; i++) questions[i].id = "q" + std::to_string(i);
  return questions;
}

// NOLINTNEXTLINE
TEST(OrderingTest, DeclaredOrder) {
  util::Random random(1);
  EXPECT_THAT(session::OrderQuestions(Questions(4), false, &random),
              ElementsAre("q0", "q1", "q2", "q3"));
}

// NOLINTNEXTLINE
TEST(OrderingTest, ShuffleIsUniform) {
  const size_t n = 4;
  const int rounds = 24000;
  util::Random random(12345);
  // How often each question lands in each position.
  std::map<std::pair<std::string, size_t>, int> counts;
  for (int i = 0; i < rounds; i++) {
    std::vector<std::string> order =
        session::OrderQuestions(Questions(n), true, &random);
    ASSERT_THAT(order, UnorderedElementsAre("q0", "q1", "q2", "q3"));
    for (size_t pos = 0; pos < n; pos++) counts[{order[pos], pos}]++;
  }
  ASSERT_THAT(counts, SizeIs(n * n));
  for (const auto& count : counts) {
    EXPECT_NEAR(count.second, rounds / n, rounds / n / 10)
        << count.first.first << " at " << count.first.second;
  }
}

// NOLINTNEXTLINE
TEST(OrderingTest, PresentStripsTheAnswerKey) {
  Question question;
  question.id = "q";
  question.options = {{"a", "A", true}, {"b", "B", false}};
  question.type = QuestionType::CODING;
  question.test_cases = {{"1", "1", false}, {"2", "2", true}};
  util::Random random(1);
  session::PresentedQuestion presented =
      session::Present(question, false, &random);
  ASSERT_THAT(presented.sample_cases, SizeIs(1));
  EXPECT_EQ(presented.sample_cases[0].input, "1");
}

// NOLINTNEXTLINE
TEST(OrderingTest, OptionShuffleKeepsEveryOption) {
  Question question;
  question.id = "q";
  question.options = {{"a", "A", true}, {"b", "B", false}, {"c", "C", false}};
  util::Random random(3);
  std::map<std::string, int> first;
  for (int i = 0; i < 3000; i++) {
    session::PresentedQuestion presented =
        session::Present(question, true, &random);
    ASSERT_THAT(presented.options, SizeIs(3));
    first[presented.options[0].id]++;
    std::set<std::string> ids;
    for (const auto& option : presented.options) ids.insert(option.id);
    EXPECT_THAT(ids, ElementsAre("a", "b", "c"));
  }
  for (const auto& count : first) EXPECT_NEAR(count.second, 1000, 150);

  question.type = QuestionType::TRUE_FALSE;
  session::PresentedQuestion presented = session::Present(question, true, &random);
  EXPECT_EQ(presented.options[0].id, "a");
}

}  // namespace
