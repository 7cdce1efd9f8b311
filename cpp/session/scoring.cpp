#include "session/scoring.hpp"

#include <set>

#include "util/misc.hpp"

namespace session {

bool ChoiceIsCorrect(const catalog::Question& question,
                     const AnswerValue& value) {
  std::set<std::string> expected;
  for (const catalog::Option& option : question.options) {
    if (option.is_correct) expected.insert(option.id);
  }
  std::set<std::string> selected;
  for (const std::string& choice : value.selected) {
    const catalog::Option* match = nullptr;
    for (const catalog::Option& option : question.options) {
      if (option.id == choice) match = &option;
    }
    if (match == nullptr &&
        question.type == catalog::QuestionType::TRUE_FALSE) {
      for (const catalog::Option& option : question.options) {
        if (util::lower(option.text) == util::lower(util::trim(choice))) {
          match = &option;
        }
      }
    }
    // Unknown options make the answer wrong.
    if (match == nullptr) return false;
    selected.insert(match->id);
  }
  return !expected.empty() && selected == expected;
}

AnswerRecord ScoreAnswer(const catalog::Question& question, AnswerValue value,
                         int64_t now) {
  AnswerRecord record;
  record.question_id = question.id;
  record.submitted_at = now;
  if (question.IsChoice()) {
    record.scored = true;
    record.is_correct = ChoiceIsCorrect(question, value);
    record.points_awarded = record.is_correct ? question.points : 0;
  }
  record.value = std::move(value);
  return record;
}

AnswerRecord ScoreCode(const catalog::Question& question,
                       const executor::ExecutionSummary& summary,
                       int64_t now) {
  AnswerRecord record;
  record.question_id = question.id;
  record.submitted_at = now;
  record.scored = true;
  size_t defined = question.test_cases.size();
  if (defined > 0) {
    record.is_correct = summary.passed == defined;
    record.points_awarded = question.points * summary.passed / defined;
  }
  return record;
}

double TotalScore(const Session& session) {
  double total = 0;
  for (const auto& answer : session.answers) {
    total += answer.second.points_awarded;
  }
  return total;
}

double MaxScore(const Session& session, const QuestionIndex& questions) {
  double max = 0;
  for (const std::string& id : session.question_order) {
    auto it = questions.find(id);
    if (it != questions.end()) max += it->second->points;
  }
  return max;
}

}  // namespace session
