#include "session/ordering.hpp"

namespace session {

std::vector<std::string> OrderQuestions(
    const std::vector<catalog::Question>& questions, bool randomize,
    util::Random* random) {
  std::vector<std::string> order;
  order.reserve(questions.size());
  for (const catalog::Question& question : questions) {
    order.push_back(question.id);
  }
  if (randomize) random->Shuffle(&order);
  return order;
}

PresentedQuestion Present(const catalog::Question& question,
                          bool shuffle_options, util::Random* random) {
  PresentedQuestion presented;
  presented.id = question.id;
  presented.title = question.title;
  presented.description = question.description;
  presented.type = question.type;
  presented.difficulty = question.difficulty;
  presented.points = question.points;
  presented.time_limit_seconds = question.time_limit_seconds;
  presented.memory_limit_mb = question.memory_limit_mb;
  presented.language = question.language;
  presented.starter_code = question.starter_code;
  for (const catalog::Option& option : question.options) {
    presented.options.push_back({option.id, option.text});
  }
  if (shuffle_options &&
      question.type == catalog::QuestionType::MULTIPLE_CHOICE) {
    random->Shuffle(&presented.options);
  }
  for (const executor::TestCase& test_case : question.test_cases) {
    if (!test_case.hidden) presented.sample_cases.push_back(test_case);
  }
  return presented;
}

}  // namespace session
