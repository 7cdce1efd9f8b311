#ifndef SESSION_SCORING_HPP
#define SESSION_SCORING_HPP

#include <map>
#include <string>

#include "catalog/catalog.hpp"
#include "executor/executor.hpp"
#include "session/model.hpp"

namespace session {

using QuestionIndex = std::map<std::string, const catalog::Question*>;

// Exact match between the selected options and the options marked correct.
// Selections name option ids; true/false questions also accept the option
// text, ignoring case.
bool ChoiceIsCorrect(const catalog::Question& question,
                     const AnswerValue& value);

// Scores a choice or essay answer. Essays stay unscored.
AnswerRecord ScoreAnswer(const catalog::Question& question, AnswerValue value,
                         int64_t now);

// Points proportional to the passed fraction of the cases the question
// defines, correct only if all of them passed.
AnswerRecord ScoreCode(const catalog::Question& question,
                       const executor::ExecutionSummary& summary,
                       int64_t now);

double TotalScore(const Session& session);

// Sum of the points of the questions in the order of the session.
double MaxScore(const Session& session, const QuestionIndex& questions);

}  // namespace session

#endif
