#ifndef SESSION_ORDERING_HPP
#define SESSION_ORDERING_HPP

#include <string>
#include <vector>

#include "catalog/catalog.hpp"
#include "util/random.hpp"

namespace session {

// A question as shown to the candidate: no answer key, no hidden test cases.
struct PresentedQuestion {
  struct Choice {
    std::string id;
    std::string text;
  };

  std::string id;
  std::string title;
  std::string description;
  catalog::QuestionType type = catalog::QuestionType::MULTIPLE_CHOICE;
  double difficulty = 0;
  double points = 0;
  std::vector<Choice> options;
  std::vector<executor::TestCase> sample_cases;
  uint32_t time_limit_seconds = 0;
  uint32_t memory_limit_mb = 0;
  std::string language;
  std::string starter_code;
};

// Ids of the questions, shuffled uniformly or in declared order.
std::vector<std::string> OrderQuestions(
    const std::vector<catalog::Question>& questions, bool randomize,
    util::Random* random);

// Options of multiple choice questions are shuffled when shuffle_options is
// set. True/false options keep their order.
PresentedQuestion Present(const catalog::Question& question,
                          bool shuffle_options, util::Random* random);

}  // namespace session

#endif
